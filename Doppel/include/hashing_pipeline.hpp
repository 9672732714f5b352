//
// hashing_pipeline.hpp
// Concurrent decode + fingerprint of every image under a set of roots
//

#pragma once

#include "cancellation.hpp"
#include "hash_index.hpp"
#include "image_hasher.hpp"
#include "input_discovery.hpp"
#include "progress_tracker.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace doppel {

struct FailedFile {
    std::filesystem::path path;
    std::string reason;
};

struct PipelineOptions {
    int threads = 4;          // -1 = one per hardware thread
    int prefetchFactor = 8;   // queued paths per worker
};

class HashingPipeline {
public:
    /**
     * @param hasher Fingerprinting primitive, shared by all workers (must be thread-safe)
     * @param options Worker count and queue depth
     * @param cancel Optional token checked between tasks
     * @param progressCallback Optional, rate-limited, called from worker threads
     */
    HashingPipeline(const ImageHasher& hasher,
                    PipelineOptions options = {},
                    const CancellationToken* cancel = nullptr,
                    ProgressTracker::ProgressCallback progressCallback = nullptr);

    /**
     * Build one merged index from files and directories. JSON files found among the
     * inputs are loaded as persisted indexes, everything else is hashed as an image.
     * Files that fail to decode are skipped and reported through failures().
     * @throws std::runtime_error for a missing root
     * @throws IndexFormatError for a malformed persisted index
     * @throws OperationCancelled if the token fires before the batch completes
     */
    HashIndex run(const std::vector<std::filesystem::path>& roots);
    HashIndex run(const DiscoveredInputs& inputs);

    // Hash a list of image files only
    HashIndex hashImages(const std::vector<std::filesystem::path>& images);

    const std::vector<FailedFile>& failures() const { return m_failures; }
    size_t hashedCount() const { return m_hashed; }

    // Worker count actually used for a batch of `jobs` files
    int workerCount(size_t jobs) const;

private:
    const ImageHasher& m_hasher;
    PipelineOptions m_options;
    const CancellationToken* m_cancel;
    ProgressTracker::ProgressCallback m_progressCallback;

    std::vector<FailedFile> m_failures;
    std::mutex m_failuresMutex;
    size_t m_hashed = 0;

    bool cancelled() const { return m_cancel && m_cancel->isCancelled(); }
    void recordFailure(const std::filesystem::path& path, const std::string& reason);
};

} // namespace doppel
