//
// save_results.cpp
// JSON output of hash indexes and duplicate search results
//

#include "save_results.hpp"
#include "index_io.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace doppel_app {

namespace fs = std::filesystem;

nlohmann::json resultToJson(const doppel::DoppelgaengerResult& result)
{
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [referencePath, matches] : result) {
        out[referencePath] = matches;
    }
    return out;
}

void writeOutput(const std::string& outputPath, const std::function<void(std::ostream&)>& writer)
{
    if (outputPath.empty()) {
        writer(std::cout);
        std::cout.flush();
        if (!std::cout) throw std::runtime_error("Failed to write to standard output");
        return;
    }

    const fs::path destination(outputPath);
    fs::path staging = destination;
    staging += ".partial";

    try {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error(std::format("Cannot create output file '{}'", staging.string()));
        }
        writer(out);
        out.flush();
        if (!out) {
            throw std::runtime_error(std::format("Failed to write output file '{}'", staging.string()));
        }
    }
    catch (const std::exception&) {
        std::error_code ignored;
        fs::remove(staging, ignored);
        throw;
    }

    std::error_code ec;
    fs::rename(staging, destination, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(staging, ignored);
        throw std::runtime_error(std::format("Cannot move output into '{}': {}", outputPath, ec.message()));
    }
}

void saveIndexJson(const doppel::HashIndex& index, const std::string& outputPath)
{
    writeOutput(outputPath, [&index](std::ostream& out) { doppel::saveIndex(index, out); });
}

void saveResultJson(const doppel::DoppelgaengerResult& result, const std::string& outputPath)
{
    writeOutput(outputPath, [&result](std::ostream& out) { out << doppel::dumpJson(resultToJson(result), "result") << '\n'; });
}

} // namespace doppel_app
