#include "hashing_pipeline.hpp"
#include "errors.hpp"
#include "index_io.hpp"
#include "logger.hpp"
#include "work_queue.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <stdexcept>
#include <thread>
#include <utility>

namespace doppel {

namespace fs = std::filesystem;

namespace {

// Closes the queue when the producer leaves, even by exception, so workers can be joined
class QueueCloser {
public:
    explicit QueueCloser(WorkQueue<fs::path>& queue) : m_queue(queue) {}
    ~QueueCloser() { m_queue.setSentinel(); }

    QueueCloser(const QueueCloser&) = delete;
    QueueCloser& operator=(const QueueCloser&) = delete;

private:
    WorkQueue<fs::path>& m_queue;
};

} // namespace

HashingPipeline::HashingPipeline(const ImageHasher& hasher,
                                 PipelineOptions options,
                                 const CancellationToken* cancel,
                                 ProgressTracker::ProgressCallback progressCallback)
    : m_hasher(hasher),
      m_options(options),
      m_cancel(cancel),
      m_progressCallback(std::move(progressCallback))
{
    if (m_options.threads == 0 || m_options.threads < -1) {
        throw std::invalid_argument(std::format("threads must be -1 or positive (received {})", m_options.threads));
    }
    if (m_options.prefetchFactor <= 0) {
        throw std::invalid_argument(std::format("prefetchFactor must be positive (received {})", m_options.prefetchFactor));
    }
}

int HashingPipeline::workerCount(size_t jobs) const
{
    int threads = m_options.threads;
    if (threads == -1) {
        threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    }
    return static_cast<int>(std::clamp<size_t>(jobs, 1, static_cast<size_t>(threads)));
}

HashIndex HashingPipeline::run(const std::vector<fs::path>& roots)
{
    return run(collectInputs(roots));
}

HashIndex HashingPipeline::run(const DiscoveredInputs& inputs)
{
    HashIndex index;

    for (const auto& file : inputs.indexFiles) {
        if (cancelled()) throw OperationCancelled();
        index.merge(loadIndex(file));
    }

    index.merge(hashImages(inputs.images));
    return index;
}

HashIndex HashingPipeline::hashImages(const std::vector<fs::path>& images)
{
    HashIndex index;
    std::mutex indexMutex;
    std::atomic<size_t> hashed{ 0 };

    ProgressTracker tracker(ProgressStage::Hash, images.size(), m_progressCallback);

    if (images.empty()) {
        tracker.forceUpdate();
        return index;
    }

    const int threads = workerCount(images.size());
    WorkQueue<fs::path> queue(static_cast<size_t>(threads) * m_options.prefetchFactor, "hash");

    DOPPEL_INFO("pipeline", "Hashing ", images.size(), " file(s) on ", threads, " thread(s)");

    auto worker = [&] {
        while (auto path = queue.pop()) {
            if (cancelled()) {
                queue.clear();
                break;
            }

            Fingerprint fp;
            try {
                fp = m_hasher.hashFile(*path);
            }
            catch (const std::exception& e) {
                recordFailure(*path, e.what());
                tracker.updateFailed();
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(indexMutex);
                index.insert(fp, path->string());
            }
            hashed.fetch_add(1, std::memory_order_relaxed);
            tracker.update();
        }
    };

    {
        std::vector<std::jthread> workers;
        workers.reserve(threads);
        QueueCloser closer(queue);

        for (int i = 0; i < threads; ++i) workers.emplace_back(worker);
        for (const auto& path : images) {
            if (cancelled()) {
                queue.clear();
                break;
            }
            if (!queue.push(path)) break;
        }
    } // queue closed, then workers joined

    m_hashed += hashed.load();
    tracker.forceUpdate();

    std::ranges::sort(m_failures, {}, &FailedFile::path);

    if (cancelled()) {
        DOPPEL_INFO("pipeline", "Cancelled after ", hashed.load(), " of ", images.size(), " file(s)");
        throw OperationCancelled();
    }

    DOPPEL_INFO("pipeline", "Hashed ", hashed.load(), " file(s), ", images.size() - hashed.load(), " failed");
    return index;
}

void HashingPipeline::recordFailure(const fs::path& path, const std::string& reason)
{
    DOPPEL_WARN("pipeline", path.string(), " - failed to read: ", reason);

    std::lock_guard<std::mutex> lock(m_failuresMutex);
    m_failures.push_back({ path, reason });
}

} // namespace doppel
