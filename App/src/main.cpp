//
//  CLI front-end for the doppelgaenger near-duplicate finder
//

#include <argparse/argparse.hpp>

#include "arguments.hpp"
#include "cancellation.hpp"
#include "find_command.hpp"
#include "hash_command.hpp"
#include "logger.hpp"

#include <csignal>
#include <iostream>

using namespace doppel_app;

namespace {

doppel::CancellationToken g_cancel;

void onInterrupt(int signal)
{
    g_cancel.requestCancel();
    // A second interrupt terminates immediately
    std::signal(signal, SIG_DFL);
}

} // namespace

int main(int argc, char* argv[])
{
    argparse::ArgumentParser program("doppelgaenger", "1.0");
    program.add_description("Perceptual-hash image hashing & near-duplicate finder");
    program.add_epilog("Examples:\n  doppelgaenger hash -o library.json ~/Pictures\n"
                       "  doppelgaenger find -r library.json -d 4 -o matches.json ~/Downloads\n\n"
                       "For detailed options: doppelgaenger <command> --help");

    RawArguments raw;

    argparse::ArgumentParser hash_command("hash");
    hash_command.add_description("Compute perceptual hashes and output them as a merged JSON index");

    argparse::ArgumentParser find_command("find");
    find_command.add_description("Find target images within a Hamming distance of the reference images");

    // Common arguments for both commands
    auto addCommonArgs = [&](argparse::ArgumentParser& cmd) {
        cmd.add_argument("-o", "--output")
            .default_value(std::string(defaults::DEFAULT_OUTPUT))
            .store_into(raw.outputPath)
            .help("Output JSON file (default: standard output)");

        cmd.add_argument("-t", "--threads")
            .default_value(defaults::THREADS)
            .scan<'i', int>()
            .store_into(raw.threads)
            .help("Number of worker threads for decoding and hashing (-1 = auto-detect)");

        cmd.add_argument("--prefetch-factor")
            .default_value(defaults::PREFETCH_FACTOR)
            .scan<'i', int>()
            .store_into(raw.prefetchFactor)
            .help("Queued files per worker thread");

        cmd.add_argument("-f", "--freq-factor")
            .default_value(defaults::FREQ_FACTOR)
            .scan<'i', int>()
            .store_into(raw.freqFactor)
            .help("Frequency oversampling factor (image reduced to 8*f x 8*f before the DCT)");

        cmd.add_argument("-l", "--log-level")
            .default_value(defaults::LOG_LEVEL)
            .scan<'i', int>()
            .store_into(raw.logLevel)
            .help("Logging verbosity (5=errors only, 4=warnings, 3=info, 2=debug, 1=trace)");

        cmd.add_argument("-q", "--quiet")
            .implicit_value(true)
            .default_value(defaults::QUIET)
            .store_into(raw.quiet)
            .help("Do not print the configuration table, progress bars or summary");

        cmd.add_argument("inputs")
            .nargs(argparse::nargs_pattern::at_least_one)
            .help("Folders, images and JSON index files");
    };

    addCommonArgs(hash_command);
    addCommonArgs(find_command);

    // Find-specific arguments
    find_command.add_argument("-r", "--reference")
        .required()
        .append()
        .help("Reference folder, image or JSON index (can be repeated)");

    find_command.add_argument("-d", "--distance")
        .default_value(defaults::DISTANCE)
        .scan<'i', int>()
        .store_into(raw.distance)
        .help("Max Hamming distance (0 = identical fingerprints, up to 64)");

    program.add_subparser(hash_command);
    program.add_subparser(find_command);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << '\n';
        std::cerr << program;
        return 1;
    }

    Arguments::Command command;
    if (program.is_subcommand_used("hash")) {
        command = Arguments::Command::Hash;
        raw.inputs = hash_command.get<std::vector<std::string>>("inputs");
    }
    else if (program.is_subcommand_used("find")) {
        command = Arguments::Command::Find;
        raw.inputs = find_command.get<std::vector<std::string>>("inputs");
        raw.references = find_command.get<std::vector<std::string>>("--reference");
    }
    else {
        std::cerr << "No command specified. Use 'hash' or 'find'\n";
        std::cerr << program;
        return 1;
    }

    try {
        const Arguments args(raw, command);

        doppel::logger::ScopedLogger logging(doppel::logger::fromVerbosity(args.logLevel));
        std::signal(SIGINT, onInterrupt);
        std::signal(SIGTERM, onInterrupt);

        return command == Arguments::Command::Hash
            ? handleHashCommand(args, g_cancel)
            : handleFindCommand(args, g_cancel);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
