//
// helpers.hpp
// Console helpers for the doppelgaenger CLI. Everything here writes to stderr:
// stdout is reserved for JSON output.
//

#pragma once

#include <chrono>
#include <concepts>
#include <format>
#include <locale>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <indicators/progress_bar.hpp>

#include "progress_tracker.hpp"

namespace doppel_app {

// Cursor visibility control
void hideCursor();
void showCursor();

// Progress bar creation
indicators::ProgressBar bar(std::string_view prefix, bool show_elapsed = false, bool show_remaining = false);

// Adapts a progress bar to the tracker callback; failures turn the bar yellow
doppel::ProgressTracker::ProgressCallback barCallback(indicators::ProgressBar& progressBar);

// Number formatting
template<std::integral T>
std::string withCommas(T number)
{
    try {
        static const auto loc = std::locale("");
        return std::format(loc, "{:L}", number);
    }
    catch (const std::runtime_error&) {
        // Unknown user locale (e.g. LANG set but not generated)
        return std::format("{}", number);
    }
}

std::string formatDuration(std::chrono::milliseconds elapsed);

// One row per input set in the configuration table
struct InputSummary {
    std::string label;
    size_t images = 0;
    size_t rawImages = 0;
    size_t indexFiles = 0;
};

std::string renderConfiguration(const std::vector<InputSummary>& sets, int threads, int freqFactor,
                                 int distance = -1);

void printConfiguration(const std::vector<InputSummary>& sets, int threads, int freqFactor,
                        int distance = -1);

} // namespace doppel_app
