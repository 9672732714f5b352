//
// save_results.hpp
// JSON output of hash indexes and duplicate search results
//

#pragma once

#include <functional>
#include <iosfwd>
#include <string>
#include <nlohmann/json.hpp>

#include "doppel_search.hpp"
#include "hash_index.hpp"

namespace doppel_app {

// { "<reference path>": ["<target path>", ...] }
nlohmann::json resultToJson(const doppel::DoppelgaengerResult& result);

/**
 * Run `writer` against a file, or against stdout when outputPath is empty.
 * Files are written next to the destination and renamed into place, so a
 * failed write never leaves a truncated result behind.
 * @throws std::runtime_error if the output cannot be written
 */
void writeOutput(const std::string& outputPath, const std::function<void(std::ostream&)>& writer);

void saveIndexJson(const doppel::HashIndex& index, const std::string& outputPath);

void saveResultJson(const doppel::DoppelgaengerResult& result, const std::string& outputPath);

} // namespace doppel_app
