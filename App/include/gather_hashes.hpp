#pragma once

#include "arguments.hpp"
#include "cancellation.hpp"
#include "hashing_pipeline.hpp"
#include "helpers.hpp"
#include "input_discovery.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace doppel_app {

struct GatheredIndex {
    doppel::HashIndex index;
    std::vector<doppel::FailedFile> failures;
    size_t hashed = 0;
};

InputSummary summarize(std::string label, const doppel::DiscoveredInputs& inputs);

/**
 * Load the index files and hash the images of one input set, with a progress
 * bar unless args.quiet is set
 * @throws doppel::OperationCancelled, doppel::IndexFormatError
 */
GatheredIndex gatherHashes(std::string_view label,
                           const doppel::DiscoveredInputs& inputs,
                           const Arguments& args,
                           const doppel::CancellationToken& cancel);

} // namespace doppel_app
