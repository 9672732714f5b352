#include "doppel_search.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <format>
#include <stdexcept>
#include <utility>

namespace doppel {

DoppelSearch::DoppelSearch(const HashIndex& target)
    : m_target(target),
      m_tree(target.fingerprints())
{
    DOPPEL_DEBUG("search", "Built tree over ", m_tree.size(), " target fingerprint(s)");
}

std::vector<VpTree::Match> DoppelSearch::matches(const Fingerprint& fp, int maxDistance) const
{
    if (maxDistance < 0) {
        throw std::invalid_argument(std::format("distance must be non-negative (received {})", maxDistance));
    }
    return m_tree.rangeQuery(fp, maxDistance);
}

DoppelgaengerResult DoppelSearch::find(const HashIndex& reference,
                                       int maxDistance,
                                       const CancellationToken* cancel,
                                       ProgressTracker::ProgressCallback progressCallback) const
{
    if (maxDistance < 0) {
        throw std::invalid_argument(std::format("distance must be non-negative (received {})", maxDistance));
    }

    DoppelgaengerResult result;
    ProgressTracker tracker(ProgressStage::Search, reference.size(), std::move(progressCallback));
    size_t matchedFingerprints = 0;

    for (const auto& [fp, referencePaths] : reference) {
        if (cancel) cancel->throwIfCancelled();

        HashIndex::PathSet matched;
        for (const auto& match : m_tree.rangeQuery(fp, maxDistance)) {
            const auto* targetPaths = m_target.find(match.fingerprint);
            if (targetPaths) matched.insert(targetPaths->begin(), targetPaths->end());
        }

        tracker.update();
        if (matched.empty()) continue;

        ++matchedFingerprints;
        for (const auto& path : referencePaths) {
            // A path listed under two fingerprints (merged stale indexes) collects both match sets
            result[path].insert(matched.begin(), matched.end());
        }
    }

    tracker.forceUpdate();
    DOPPEL_INFO("search", matchedFingerprints, " of ", reference.size(),
                " reference fingerprint(s) matched within distance ", maxDistance);
    return result;
}

DoppelgaengerResult findDoppelgaenger(const HashIndex& reference,
                                      const HashIndex& target,
                                      int maxDistance,
                                      const CancellationToken* cancel,
                                      ProgressTracker::ProgressCallback progressCallback)
{
    return DoppelSearch(target).find(reference, maxDistance, cancel, std::move(progressCallback));
}

} // namespace doppel
