//
// logger.hpp
// Asynchronous ring-buffer logger and the DOPPEL_* logging macros
//

#pragma once

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>

#define DOPPEL_TRACE(...) ::doppel::logger::trace(__VA_ARGS__)
#define DOPPEL_DEBUG(...) ::doppel::logger::debug(__VA_ARGS__)
#define DOPPEL_INFO(...) ::doppel::logger::info(__VA_ARGS__)
#define DOPPEL_WARN(...) ::doppel::logger::warn(__VA_ARGS__)
#define DOPPEL_ERROR(...) ::doppel::logger::error(__VA_ARGS__)

/**
 * -------------
 * USAGE OVERVIEW
 * -------------
 *
 * // Initialize once, specifying log level and ring size (power-of-two):
 * doppel::logger::init(doppel::logger::Level::INFO, 4096);
 *
 * // Log from any thread with:
 * DOPPEL_WARN("pipeline", path, " - failed to read: ", reason);
 *
 * // On shutdown (drains pending lines):
 * doppel::logger::shutdown();
*/

namespace doppel::logger
{
    enum Level : uint8_t
    {
        TRACE = 0,
        DEBUG,
        INFO,
        WARN,
        ERROR_L
    };

    constexpr const char* levelToStr(Level lv) noexcept
    {
        switch (lv)
        {
        case TRACE: return "TRACE";
        case DEBUG: return "DEBUG";
        case INFO:  return "INFO";
        case WARN:  return "WARN";
        case ERROR_L: return "ERROR";
        }
        return "UNKNOWN";
    }

    // CLI verbosity: 1=trace, 2=debug, 3=info, 4=warnings, 5=errors only
    constexpr Level fromVerbosity(int verbosity) noexcept
    {
        if (verbosity <= 1) return TRACE;
        if (verbosity >= 5) return ERROR_L;
        return static_cast<Level>(verbosity - 1);
    }

    namespace detail
    {
        inline void appendOne(std::string& dest, const char* str)
        {
            if (str) {
                dest += str;
            }
        }

        inline void appendOne(std::string& dest, const std::string& s)
        {
            dest += s;
        }

        template <typename T,
            typename std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, int> = 0>
        inline void appendOne(std::string& dest, T val)
        {
            char buf[64];
            auto end = std::to_chars(buf, buf + sizeof(buf), val).ptr;
            dest.append(buf, static_cast<size_t>(end - buf));
        }

        // Anything else with an operator<< (paths, fingerprints, bools)
        template <typename T,
            typename std::enable_if_t<(!std::is_arithmetic_v<std::decay_t<T>> || std::is_same_v<std::decay_t<T>, bool>) &&
            !std::is_same_v<std::decay_t<T>, std::string> &&
            !std::is_convertible_v<T, const char*>, int> = 0>
        inline void appendOne(std::string& dest, const T& val)
        {
            thread_local std::ostringstream oss;
            oss.str(std::string{});
            oss.clear();
            oss << std::boolalpha << val;
            dest += oss.str();
        }

        template <typename... Ts>
        inline void buildString(std::string& dest, Ts&&... args)
        {
            (appendOne(dest, std::forward<Ts>(args)), ...);
        }
    } // namespace detail

    struct LogMessage
    {
        Level level = INFO;
        int64_t microsSinceEpoch = 0;
        std::string id;
        std::string text;
    };

    class LogRing
    {
    public:
        explicit LogRing(size_t size) : size_(size), mask_(size - 1), buffer_(new LogMessage[size]), head_(0), tail_(0) {}

        ~LogRing() { delete[] buffer_; }

        LogRing(const LogRing&) = delete;
        LogRing& operator=(const LogRing&) = delete;

        // Multi-producer push. Returns false if the ring was full.
        bool tryPush(LogMessage&& msg)
        {
            std::lock_guard<std::mutex> lock(pushMutex_);
            const auto tail = tail_.load(std::memory_order_relaxed);
            if (tail - head_.load(std::memory_order_acquire) >= size_) return false;

            buffer_[tail & mask_] = std::move(msg);
            tail_.store(tail + 1, std::memory_order_release);
            return true;
        }

        // Single-consumer pop
        bool tryPop(LogMessage& out)
        {
            const auto currentHead = head_.load(std::memory_order_relaxed);
            if (currentHead >= tail_.load(std::memory_order_acquire)) return false;

            out = std::move(buffer_[currentHead & mask_]);
            head_.store(currentHead + 1, std::memory_order_release);
            return true;
        }

    private:
        size_t size_;
        size_t mask_;
        LogMessage* buffer_;
        std::mutex pushMutex_;
        alignas(64) std::atomic<uint64_t> head_;
        alignas(64) std::atomic<uint64_t> tail_;
    };

    class Logger
    {
    public:
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        static Logger& instance()
        {
            static Logger s;
            return s;
        }

        // Called once at startup. ringSize is rounded up to a power of two.
        void init(Level level, size_t ringSize, std::ostream* sink)
        {
            if (!ring_)
            {
                size_t size = 1;
                while (size < ringSize) size <<= 1;

                ring_ = new LogRing(size);
                sink_ = sink ? sink : &std::cerr;
                currentLevel_.store(level, std::memory_order_relaxed);
                dropped_.store(0, std::memory_order_relaxed);
                running_.store(true, std::memory_order_release);
                consumerThread_ = std::thread(&Logger::consumerLoop, this);
            }
        }

        template<typename IdType, typename... Args>
        void log(Level lv, IdType&& id, Args&&... args)
        {
            if (!running_.load(std::memory_order_acquire)) return;
            if (lv < currentLevel_.load(std::memory_order_relaxed)) return;

            std::string text;
            text.reserve(128);
            detail::buildString(text, std::forward<Args>(args)...);

            LogMessage msg;
            msg.level = lv;
            msg.microsSinceEpoch = nowMicrosSinceEpoch();
            msg.id = std::forward<IdType>(id);
            msg.text = std::move(text);

            if (!ring_->tryPush(std::move(msg))) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
            }
        }

        void shutdown()
        {
            if (running_.exchange(false, std::memory_order_acq_rel))
            {
                if (consumerThread_.joinable()) {
                    consumerThread_.join();
                }

                const auto dropped = dropped_.load(std::memory_order_relaxed);
                if (dropped > 0) {
                    *sink_ << "[logger] " << dropped << " message(s) dropped (ring full)\n";
                }
                sink_->flush();

                delete ring_;
                ring_ = nullptr;
            }
        }

        bool enabled(Level lv) const
        {
            return running_.load(std::memory_order_acquire) && lv >= currentLevel_.load(std::memory_order_relaxed);
        }

    private:
        Logger() : ring_(nullptr), sink_(&std::cerr), currentLevel_(WARN), running_(false), dropped_(0) {}
        ~Logger() { shutdown(); }

        static int64_t nowMicrosSinceEpoch()
        {
            using namespace std::chrono;
            return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
        }

        void consumerLoop()
        {
            while (running_.load(std::memory_order_acquire))
            {
                LogMessage msg;
                while (ring_->tryPop(msg)) { printMessage(msg); }

                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }

            // Drain any remaining
            LogMessage leftover;
            while (ring_->tryPop(leftover)) { printMessage(leftover); }
        }

        void printMessage(const LogMessage& lm) const
        {
            using namespace std::chrono;
            auto tp = system_clock::time_point(microseconds(lm.microsSinceEpoch));

            std::time_t t = system_clock::to_time_t(tp);
            std::tm tmBuf{};
#ifdef _WIN32
            localtime_s(&tmBuf, &t);
#else
            localtime_r(&t, &tmBuf);
#endif

            auto msPart = (lm.microsSinceEpoch / 1000) % 1000;

            char timeBuf[32];
            std::snprintf(timeBuf, sizeof(timeBuf),
                "%02d:%02d:%02d.%03d",
                tmBuf.tm_hour, tmBuf.tm_min, tmBuf.tm_sec,
                static_cast<int>(msPart));

            *sink_ << "[" << timeBuf << "] "
                << "[" << levelToStr(lm.level) << "] ";
            if (!lm.id.empty()) {
                *sink_ << "[" << lm.id << "] ";
            }
            *sink_ << lm.text << "\n";
        }

        LogRing* ring_;
        std::ostream* sink_;
        std::atomic<Level> currentLevel_;
        std::atomic<bool> running_;
        std::atomic<size_t> dropped_;
        std::thread consumerThread_;
    };

    inline void init(Level lv, size_t ringSize = 4096, std::ostream* sink = nullptr)
    {
        Logger::instance().init(lv, ringSize, sink);
    }

    inline void shutdown()
    {
        Logger::instance().shutdown();
    }

    // Keeps the logger running for the lifetime of a scope (main, a test)
    class ScopedLogger
    {
    public:
        explicit ScopedLogger(Level lv, size_t ringSize = 4096, std::ostream* sink = nullptr) { init(lv, ringSize, sink); }
        ~ScopedLogger() { shutdown(); }

        ScopedLogger(const ScopedLogger&) = delete;
        ScopedLogger& operator=(const ScopedLogger&) = delete;
    };

    template<typename IdType, typename... Args>
    inline void log(Level lv, IdType&& id, Args&&... args)
    {
        Logger::instance().log(lv, std::forward<IdType>(id), std::forward<Args>(args)...);
    }

    template<typename IdType, typename... Args>
    inline void trace(IdType&& id, Args&&... args) { log(TRACE, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void debug(IdType&& id, Args&&... args) { log(DEBUG, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void info(IdType&& id, Args&&... args) { log(INFO, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void warn(IdType&& id, Args&&... args) { log(WARN, std::forward<IdType>(id), std::forward<Args>(args)...); }

    template<typename IdType, typename... Args>
    inline void error(IdType&& id, Args&&... args) { log(ERROR_L, std::forward<IdType>(id), std::forward<Args>(args)...); }

} // namespace doppel::logger
