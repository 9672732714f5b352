//
// hash_index.hpp
// Mapping from fingerprint to the set of file paths sharing it
//

#pragma once

#include "fingerprint.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace doppel {

class HashIndex {
public:
    using PathSet = std::set<std::string>;
    using Map = std::unordered_map<Fingerprint, PathSet>;
    using const_iterator = Map::const_iterator;

    /**
     * Add a path under a fingerprint
     * @return true if the path was not yet stored for that fingerprint
     */
    bool insert(const Fingerprint& fp, std::string path);

    // Union every path set of `other` into this index, key by key
    void merge(const HashIndex& other);
    void merge(HashIndex&& other);

    /**
     * Remove one path. The fingerprint entry disappears together with its last path.
     * @return true if the path was present
     */
    bool removePath(const Fingerprint& fp, const std::string& path);

    // nullptr when the fingerprint is unknown
    const PathSet* find(const Fingerprint& fp) const;
    bool contains(const Fingerprint& fp) const { return m_entries.contains(fp); }

    // Number of distinct fingerprints
    std::size_t size() const { return m_entries.size(); }
    std::size_t pathCount() const;
    bool empty() const { return m_entries.empty(); }

    std::vector<Fingerprint> fingerprints() const;

    const_iterator begin() const { return m_entries.begin(); }
    const_iterator end() const { return m_entries.end(); }

    bool operator==(const HashIndex&) const = default;

private:
    Map m_entries;
};

} // namespace doppel
