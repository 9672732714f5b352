#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace doppel_app {

namespace defaults {
    constexpr const char* DEFAULT_OUTPUT = "";

    constexpr int THREADS = 4;
    constexpr int PREFETCH_FACTOR = 8;
    constexpr int FREQ_FACTOR = 4;
    constexpr int LOG_LEVEL = 4;
    constexpr bool QUIET = false;

    constexpr int DISTANCE = 0;
    constexpr int MAX_DISTANCE = 64;
}

struct RawArguments {
    std::vector<std::string> inputs;
    std::vector<std::string> references;
    std::string outputPath = defaults::DEFAULT_OUTPUT;
    int threads = defaults::THREADS;
    int prefetchFactor = defaults::PREFETCH_FACTOR;
    int freqFactor = defaults::FREQ_FACTOR;
    int logLevel = defaults::LOG_LEVEL;
    bool quiet = defaults::QUIET;

    int distance = defaults::DISTANCE;
};

class Arguments {
public:
    enum class Command { Hash, Find };

    // @throws std::invalid_argument naming the offending option
    Arguments(const RawArguments& raw, Command command);

    const Command command;
    const std::vector<std::filesystem::path> inputs;
    const std::vector<std::filesystem::path> references;
    const std::string outputPath;
    const int threads;
    const int prefetchFactor;
    const int freqFactor;
    const int logLevel;
    const bool quiet;

    const int distance;
};

} // namespace doppel_app
