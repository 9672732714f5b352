#include "hash_command.hpp"
#include "errors.hpp"
#include "gather_hashes.hpp"
#include "helpers.hpp"
#include "save_results.hpp"

#include <chrono>
#include <iostream>
#include <rang.hpp>

using namespace rang;
using namespace doppel_app;

int doppel_app::handleHashCommand(const Arguments& args, const doppel::CancellationToken& cancel)
{
    try {
        auto start = std::chrono::steady_clock::now();

        const auto inputs = doppel::collectInputs(args.inputs);

        if (!args.quiet) {
            printConfiguration({ summarize("Inputs", inputs) }, args.threads, args.freqFactor);
            hideCursor();
        }

        auto gathered = gatherHashes("Hashing ", inputs, args, cancel);

        if (!args.quiet) showCursor();

        saveIndexJson(gathered.index, args.outputPath);

        if (!args.quiet) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

            std::cerr << fg::green << "\nIndexed " << withCommas(gathered.index.pathCount()) << " file(s) under "
                      << withCommas(gathered.index.size()) << " fingerprint(s) in " << formatDuration(elapsed)
                      << fg::reset << '\n';

            if (!gathered.failures.empty()) {
                std::cerr << fg::yellow << "Warning: " << withCommas(gathered.failures.size())
                          << " file(s) could not be read" << fg::reset << '\n';
            }
            if (!args.outputPath.empty()) {
                std::cerr << "Index saved to " << args.outputPath << '\n';
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
