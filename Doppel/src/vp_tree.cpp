#include "vp_tree.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <random>
#include <stdexcept>
#include <utility>

namespace doppel {

VpTree::VpTree(std::vector<Fingerprint> points, std::uint64_t seed)
    : m_points(std::move(points))
{
    if (m_points.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("VpTree: too many points");
    }

    m_nodes.resize(m_points.size());
    std::mt19937_64 rng(seed);
    build(0, static_cast<std::uint32_t>(m_points.size()), rng);
}

template<typename Rng>
void VpTree::build(std::uint32_t lo, std::uint32_t hi, Rng& rng)
{
    while (lo < hi) {
        std::uniform_int_distribution<std::uint32_t> pick(lo, hi - 1);
        std::swap(m_points[lo], m_points[pick(rng)]);

        Node& node = m_nodes[lo];
        node.end = hi;

        const std::uint32_t first = lo + 1;
        if (first == hi) {
            node.threshold = 0;
            node.insideEnd = hi;
            return;
        }

        // Median split: [first, mid) is no farther than points[mid], [mid, hi) no closer
        const Fingerprint vantage = m_points[lo];
        const std::uint32_t mid = first + (hi - first) / 2;
        std::nth_element(m_points.begin() + first, m_points.begin() + mid, m_points.begin() + hi,
                         [&vantage](const Fingerprint& a, const Fingerprint& b) {
                             return vantage.distance(a) < vantage.distance(b);
                         });

        node.threshold = vantage.distance(m_points[mid]);
        node.insideEnd = mid;

        build(first, mid, rng);
        lo = mid; // outside child, without another stack frame
    }
}

std::vector<VpTree::Match> VpTree::rangeQuery(const Fingerprint& query, int radius, size_t* visited) const
{
    if (radius < 0) {
        throw std::invalid_argument(std::format("radius must be non-negative (received {})", radius));
    }

    std::vector<Match> matches;
    if (m_points.empty()) return matches;

    size_t evaluations = 0;
    std::vector<std::uint32_t> pending{ 0 };

    while (!pending.empty()) {
        const std::uint32_t i = pending.back();
        pending.pop_back();

        const Node& node = m_nodes[i];
        const int d = query.distance(m_points[i]);
        ++evaluations;

        if (d <= radius) matches.push_back({ d, m_points[i] });

        const std::uint32_t first = i + 1;
        if (first < node.insideEnd && d <= node.threshold + radius) pending.push_back(first);
        if (node.insideEnd < node.end && d + radius >= node.threshold) pending.push_back(node.insideEnd);
    }

    if (visited) *visited = evaluations;
    return matches;
}

} // namespace doppel
