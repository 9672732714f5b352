//
// index_io.hpp
// JSON persistence of hash indexes: { "<fingerprint hex>": ["<path>", ...], ... }
//

#pragma once

#include "hash_index.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace doppel {

nlohmann::json indexToJson(const HashIndex& index);

/**
 * Build an index from parsed JSON. Each entry is either
 *   "<fingerprint>": ["<path>", ...]   (current layout)
 *   "<path>": "<fingerprint>"          (legacy per-file dump)
 * @param source Name used in error messages
 * @throws IndexFormatError on any other shape or on unparseable fingerprint text
 */
HashIndex indexFromJson(const nlohmann::json& json, std::string_view source = "<json>");

// @throws IndexFormatError if the file cannot be read or parsed, or repeats a key
HashIndex loadIndex(const std::filesystem::path& path);

void saveIndex(const HashIndex& index, std::ostream& out);

/**
 * Compact JSON text. File names are raw bytes and need not be UTF-8; such bytes
 * are written as U+FFFD and a warning naming `what` is logged.
 */
std::string dumpJson(const nlohmann::json& json, std::string_view what);

} // namespace doppel
