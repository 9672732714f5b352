#include "gather_hashes.hpp"
#include "image_hasher.hpp"

#include <utility>

namespace doppel_app {

InputSummary summarize(std::string label, const doppel::DiscoveredInputs& inputs)
{
    return InputSummary{
        .label = std::move(label),
        .images = inputs.images.size(),
        .rawImages = inputs.rawCount(),
        .indexFiles = inputs.indexFiles.size()
    };
}

GatheredIndex gatherHashes(std::string_view label,
                           const doppel::DiscoveredInputs& inputs,
                           const Arguments& args,
                           const doppel::CancellationToken& cancel)
{
    const doppel::PerceptualHasher hasher(args.freqFactor);
    const doppel::PipelineOptions options{ .threads = args.threads, .prefetchFactor = args.prefetchFactor };

    // Never ticked (so never drawn) in quiet mode
    auto progressBar = bar(label, true, true);
    doppel::ProgressTracker::ProgressCallback callback;
    if (!args.quiet && !inputs.images.empty()) callback = barCallback(progressBar);

    doppel::HashingPipeline pipeline(hasher, options, &cancel, std::move(callback));

    GatheredIndex gathered;
    gathered.index = pipeline.run(inputs);
    gathered.failures = pipeline.failures();
    gathered.hashed = pipeline.hashedCount();
    return gathered;
}

} // namespace doppel_app
