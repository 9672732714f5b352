#include "find_command.hpp"
#include "doppel_search.hpp"
#include "errors.hpp"
#include "gather_hashes.hpp"
#include "helpers.hpp"
#include "save_results.hpp"

#include <chrono>
#include <iostream>
#include <rang.hpp>

using namespace rang;
using namespace doppel_app;

int doppel_app::handleFindCommand(const Arguments& args, const doppel::CancellationToken& cancel)
{
    try {
        auto start = std::chrono::steady_clock::now();

        const auto referenceInputs = doppel::collectInputs(args.references);
        const auto targetInputs = doppel::collectInputs(args.inputs);

        if (!args.quiet) {
            printConfiguration({ summarize("Reference", referenceInputs), summarize("Target", targetInputs) },
                               args.threads, args.freqFactor, args.distance);
            hideCursor();
        }

        // Both indexes are complete before any lookup starts
        const auto reference = gatherHashes("Reference ", referenceInputs, args, cancel);
        const auto target = gatherHashes("Target    ", targetInputs, args, cancel);

        auto searchBar = bar("Searching ", true, false);
        doppel::ProgressTracker::ProgressCallback searchCallback;
        if (!args.quiet && !reference.index.empty()) searchCallback = barCallback(searchBar);

        const doppel::DoppelSearch search(target.index);
        const auto result = search.find(reference.index, args.distance, &cancel, std::move(searchCallback));

        if (!args.quiet) showCursor();

        saveResultJson(result, args.outputPath);

        if (!args.quiet) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

            size_t matchedPaths = 0;
            for (const auto& [path, matches] : result) matchedPaths += matches.size();

            std::cerr << fg::green << "\nCompared " << withCommas(reference.index.size()) << " reference against "
                      << withCommas(target.index.size()) << " target fingerprint(s) in " << formatDuration(elapsed)
                      << fg::reset << '\n';
            std::cerr << withCommas(result.size()) << " reference file(s) with "
                      << withCommas(matchedPaths) << " match(es) within distance " << args.distance << '\n';

            const auto failed = reference.failures.size() + target.failures.size();
            if (failed > 0) {
                std::cerr << fg::yellow << "Warning: " << withCommas(failed)
                          << " file(s) could not be read" << fg::reset << '\n';
            }
            if (!args.outputPath.empty()) {
                std::cerr << "Matches saved to " << args.outputPath << '\n';
            }
        }
    }
    catch (const doppel::OperationCancelled& e) {
        showCursor();
        std::cerr << fg::yellow << '\n' << e.what() << fg::reset << '\n';
        return 1;
    }
    catch (const std::exception& e) {
        showCursor();
        std::cerr << fg::red << "Error: " << e.what() << fg::reset << '\n';
        return 1;
    }

    return 0;
}
