//
// doppel_search.hpp
// Reference-vs-target near-duplicate search over hash indexes
//

#pragma once

#include "cancellation.hpp"
#include "hash_index.hpp"
#include "progress_tracker.hpp"
#include "vp_tree.hpp"

#include <map>
#include <string>
#include <vector>

namespace doppel {

// Reference path -> target paths within the distance. Only paths with matches appear.
using DoppelgaengerResult = std::map<std::string, HashIndex::PathSet>;

class DoppelSearch {
public:
    // Builds the tree over the distinct target fingerprints. `target` must outlive the search.
    explicit DoppelSearch(const HashIndex& target);

    /**
     * Target fingerprints within maxDistance of fp, with their distances
     * @throws std::invalid_argument if maxDistance is negative
     */
    std::vector<VpTree::Match> matches(const Fingerprint& fp, int maxDistance) const;

    /**
     * Match every reference fingerprint against the target index. All reference paths
     * sharing a fingerprint map to the same set of matched target paths.
     * @throws std::invalid_argument if maxDistance is negative
     * @throws OperationCancelled if the token fires during the search
     */
    DoppelgaengerResult find(const HashIndex& reference,
                             int maxDistance,
                             const CancellationToken* cancel = nullptr,
                             ProgressTracker::ProgressCallback progressCallback = nullptr) const;

    size_t targetSize() const { return m_tree.size(); }

private:
    const HashIndex& m_target;
    VpTree m_tree;
};

DoppelgaengerResult findDoppelgaenger(const HashIndex& reference,
                                      const HashIndex& target,
                                      int maxDistance,
                                      const CancellationToken* cancel = nullptr,
                                      ProgressTracker::ProgressCallback progressCallback = nullptr);

} // namespace doppel
