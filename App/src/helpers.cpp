//
// helpers.cpp
// Console helpers for the doppelgaenger CLI
//

#include "helpers.hpp"

#include <iostream>
#include <sstream>
#include <thread>

#include <tabulate/table.hpp>

namespace doppel_app {

using namespace tabulate;

void hideCursor() { std::cerr << "\033[?25l" << std::flush; }
void showCursor() { std::cerr << "\033[?25h" << std::flush; }

indicators::ProgressBar bar(std::string_view prefix, bool show_elapsed, bool show_remaining) {
    return indicators::ProgressBar{
        indicators::option::BarWidth{30},
        indicators::option::PrefixText{std::string(prefix)},
        indicators::option::Start{"["},
        indicators::option::Fill{"="},
        indicators::option::Lead{">"},
        indicators::option::Remainder{" "},
        indicators::option::End{"]"},
        indicators::option::ShowPercentage{true},
        indicators::option::ShowElapsedTime{show_elapsed},
        indicators::option::ShowRemainingTime{show_remaining},
        indicators::option::Stream{std::cerr}
    };
}

doppel::ProgressTracker::ProgressCallback barCallback(indicators::ProgressBar& progressBar)
{
    return [&progressBar](const doppel::ProgressInfo& info) {
        if (progressBar.is_completed()) return;

        if (info.failed > 0) {
            progressBar.set_option(indicators::option::ForegroundColor{indicators::Color::yellow});
            progressBar.set_option(indicators::option::PostfixText{
                "(" + std::to_string(info.failed) + " failed)" });
        }

        const auto percent = info.percentComplete();
        if (percent >= 100) progressBar.mark_as_completed();
        else progressBar.set_progress(percent);
    };
}

std::string formatDuration(std::chrono::milliseconds elapsed)
{
    const double seconds = elapsed.count() / 1000.0;
    if (seconds < 1.0) return std::format("{} ms", elapsed.count());
    if (seconds < 60.0) return std::format("{:.2f} s", seconds);

    const auto minutes = static_cast<long long>(seconds / 60);
    return std::format("{} m {:.1f} s", minutes, seconds - minutes * 60.0);
}

std::string renderConfiguration(const std::vector<InputSummary>& sets, int threads, int freqFactor, int distance)
{
    const int side = 8 * freqFactor;
    const std::string threadsStr = threads == -1
        ? std::format("auto ({})", std::thread::hardware_concurrency())
        : std::to_string(threads);

    Table inputs;
    inputs.add_row({ "Set", "Images", "Raw", "Index files" });
    for (const auto& set : sets) {
        inputs.add_row({ set.label, withCommas(set.images), withCommas(set.rawImages), withCommas(set.indexFiles) });
    }
    inputs.format().width(16).font_align(FontAlign::center);
    inputs[0].format().font_style({ FontStyle::bold });

    Table::Row_t headerRow = { "Hash", "Img Size", "Threads" };
    Table::Row_t dataRow = { "64 bits", std::format("{}x{} pixels", side, side), threadsStr };
    if (distance >= 0) {
        headerRow.push_back("Max Distance");
        dataRow.push_back(std::to_string(distance));
    }

    Table settings;
    settings.add_row(headerRow).add_row(dataRow);
    settings.format().width(16).font_align(FontAlign::center);
    settings[0].format().font_style({ FontStyle::bold });

    std::ostringstream out;
    out << inputs << '\n' << settings << '\n';
    return out.str();
}

void printConfiguration(const std::vector<InputSummary>& sets, int threads, int freqFactor, int distance)
{
    std::cerr << renderConfiguration(sets, threads, freqFactor, distance) << std::endl;
}

} // namespace doppel_app
