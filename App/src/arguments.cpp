#include "arguments.hpp"

#include <concepts>
#include <format>
#include <stdexcept>
#include <string_view>

namespace doppel_app {

namespace fs = std::filesystem;

namespace {

template<std::integral T>
T validateInRange(std::string_view flag, T value, T min, T max)
{
    if (value < min || value > max) {
        throw std::invalid_argument(std::format("{} must be between {} and {} (received {}).", flag, min, max, value));
    }
    return value;
}

int validatePositive(std::string_view flag, int value)
{
    if (value <= 0) {
        throw std::invalid_argument(
            std::format("{} must be greater than zero (received {}).", flag, value));
    }
    return value;
}

int validateThreads(int value)
{
    if (value == -1 || value > 0) return value;

    throw std::invalid_argument(
        std::format("--threads must be -1 (auto) or greater than zero (received {}).", value));
}

// Paths are kept as spelled so the index records them the way the user passed them
std::vector<fs::path> validatePaths(std::string_view what, const std::vector<std::string>& raw, bool required)
{
    if (required && raw.empty()) {
        throw std::invalid_argument(std::format("At least one {} must be provided.", what));
    }

    std::vector<fs::path> paths;
    paths.reserve(raw.size());

    for (const auto& entry : raw) {
        if (entry.empty()) {
            throw std::invalid_argument(std::format("Empty {} path.", what));
        }

        std::error_code ec;
        if (!fs::exists(entry, ec)) {
            throw std::invalid_argument(std::format("{} '{}' does not exist.", what, entry));
        }
        paths.emplace_back(entry);
    }
    return paths;
}

std::string validateOutput(const std::string& output)
{
    if (output.empty()) return output;

    const fs::path path(output);
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        throw std::invalid_argument(std::format("Output '{}' is a directory.", output));
    }

    const auto parent = path.parent_path();
    if (!parent.empty() && !fs::is_directory(parent, ec)) {
        throw std::invalid_argument(std::format("Output directory '{}' does not exist.", parent.string()));
    }
    return output;
}

} // namespace

Arguments::Arguments(const RawArguments& raw, Command command)
    : command(command),
      inputs(validatePaths("input", raw.inputs, true)),
      references(validatePaths("reference", raw.references, command == Command::Find)),
      outputPath(validateOutput(raw.outputPath)),
      threads(validateThreads(raw.threads)),
      prefetchFactor(validatePositive("--prefetch-factor", raw.prefetchFactor)),
      freqFactor(validateInRange("--freq-factor", raw.freqFactor, 1, 16)),
      logLevel(validateInRange("--log-level", raw.logLevel, 1, 5)),
      quiet(raw.quiet),
      distance(command == Command::Find
                   ? validateInRange("--distance", raw.distance, 0, defaults::MAX_DISTANCE)
                   : raw.distance)
{
}

} // namespace doppel_app
