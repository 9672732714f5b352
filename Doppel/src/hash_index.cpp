#include "hash_index.hpp"

#include <utility>

namespace doppel {

bool HashIndex::insert(const Fingerprint& fp, std::string path)
{
    return m_entries[fp].insert(std::move(path)).second;
}

void HashIndex::merge(const HashIndex& other)
{
    for (const auto& [fp, paths] : other.m_entries) {
        m_entries[fp].insert(paths.begin(), paths.end());
    }
}

void HashIndex::merge(HashIndex&& other)
{
    if (m_entries.empty()) {
        m_entries = std::move(other.m_entries);
        other.m_entries.clear();
        return;
    }

    for (auto& [fp, paths] : other.m_entries) {
        auto [it, inserted] = m_entries.try_emplace(fp, std::move(paths));
        if (!inserted) it->second.merge(paths);
    }
    other.m_entries.clear();
}

bool HashIndex::removePath(const Fingerprint& fp, const std::string& path)
{
    auto it = m_entries.find(fp);
    if (it == m_entries.end()) return false;

    const bool removed = it->second.erase(path) > 0;
    if (it->second.empty()) m_entries.erase(it);
    return removed;
}

const HashIndex::PathSet* HashIndex::find(const Fingerprint& fp) const
{
    auto it = m_entries.find(fp);
    return it == m_entries.end() ? nullptr : &it->second;
}

std::size_t HashIndex::pathCount() const
{
    std::size_t count = 0;
    for (const auto& [fp, paths] : m_entries) count += paths.size();
    return count;
}

std::vector<Fingerprint> HashIndex::fingerprints() const
{
    std::vector<Fingerprint> keys;
    keys.reserve(m_entries.size());
    for (const auto& [fp, paths] : m_entries) keys.push_back(fp);
    return keys;
}

} // namespace doppel
