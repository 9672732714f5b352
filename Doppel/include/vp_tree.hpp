//
// vp_tree.hpp
// Immutable vantage-point tree over fingerprints for Hamming range queries
//

#pragma once

#include "fingerprint.hpp"

#include <cstdint>
#include <vector>

namespace doppel {

constexpr std::uint64_t DEFAULT_RNG_SEED = 12345;

/**
 * Nodes live in one array. Node i has its vantage point at m_points[i] and covers
 * positions [i, end): the inside child starts at i + 1 and holds points no farther
 * than `threshold` from the vantage point, the outside child starts at `insideEnd`
 * and holds points at least `threshold` away. All distances are integers, so the
 * pruning tests are exact.
 */
class VpTree {
public:
    struct Match {
        int distance;
        Fingerprint fingerprint;

        bool operator==(const Match&) const = default;
    };

    VpTree() = default;
    explicit VpTree(std::vector<Fingerprint> points, std::uint64_t seed = DEFAULT_RNG_SEED);

    /**
     * Every stored fingerprint within `radius` of `query` (inclusive)
     * @param visited Optional counter of distance evaluations, for diagnostics
     * @throws std::invalid_argument if radius is negative
     */
    std::vector<Match> rangeQuery(const Fingerprint& query, int radius, size_t* visited = nullptr) const;

    size_t size() const { return m_points.size(); }
    bool empty() const { return m_points.empty(); }

private:
    struct Node {
        int threshold = 0;
        std::uint32_t insideEnd = 0;
        std::uint32_t end = 0;
    };

    std::vector<Fingerprint> m_points;
    std::vector<Node> m_nodes;

    template<typename Rng>
    void build(std::uint32_t lo, std::uint32_t hi, Rng& rng);
};

} // namespace doppel
