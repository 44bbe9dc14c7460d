#pragma once
/**
 * @file async_logger.hpp
 * @brief Bounded, non-blocking logger for the engine and the simulation
 *
 * Callers format into a preallocated slot and return. A writer thread owns
 * the file and appends whatever has been published since its last pass.
 */

#include <lobsim/common/time.hpp>
#include <lobsim/common/macros.hpp>
#include <lobsim/common/concepts.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace lobsim {

enum class LogLevel : std::uint8_t { Debug, Info, Warn, Error };

[[nodiscard]] constexpr const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

/**
 * @brief One formatted line waiting for the writer thread
 *
 * Text longer than TEXT_CAPACITY - 1 bytes is cut.
 */
struct LogEntry {
    static constexpr std::size_t TEXT_CAPACITY = 256;

    Timestamp at{0};
    LogLevel level{LogLevel::Info};
    std::uint16_t length{0};
    std::array<char, TEXT_CAPACITY> text{};

    [[nodiscard]] std::string_view view() const noexcept { return {text.data(), length}; }
};

/**
 * @brief Fixed-capacity logger that drops instead of blocking
 *
 * Each line reads `+<microseconds since open> [LEVEL] text`. Entries below
 * the minimum level are discarded before formatting. When all BUFFER_SIZE
 * slots are waiting to be written, new entries are counted as dropped.
 *
 * Thread Safety: every public member may be called from any thread.
 * Producers serialize on one mutex and the file is written under another.
 */
class AsyncLogger {
public:
    static constexpr std::size_t BUFFER_SIZE = 4096;

private:
    std::array<LogEntry, BUFFER_SIZE> slots_{};

    // Monotonic sequence numbers; slot = seq % BUFFER_SIZE
    LOBSIM_CACHE_ALIGNED std::atomic<std::uint64_t> published_{0};
    LOBSIM_CACHE_ALIGNED std::atomic<std::uint64_t> written_{0};

    std::atomic<LogLevel> min_level_;
    std::atomic<std::uint64_t> logged_{0};
    std::atomic<std::uint64_t> dropped_{0};

    std::mutex publish_mutex_;
    std::mutex file_mutex_;
    std::ofstream file_;
    const Timestamp opened_at_;

    std::chrono::milliseconds flush_interval_;
    std::mutex wake_mutex_;
    std::condition_variable_any wake_;
    std::jthread writer_;

public:
    /**
     * @param path Log file, truncated on open
     * @param min_level Lowest level that is kept
     * @param flush_interval Longest time an entry waits before it is written
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit AsyncLogger(const std::string& path,
                         LogLevel min_level = LogLevel::Info,
                         std::chrono::milliseconds flush_interval = std::chrono::milliseconds{10})
        : min_level_(min_level)
        , file_(path, std::ios::out | std::ios::trunc)
        , opened_at_(now_ns())
        , flush_interval_(flush_interval) {
        if (!file_) {
            throw std::runtime_error("cannot open log file " + path);
        }
        writer_ = std::jthread([this](std::stop_token stop) { run_writer(stop); });
    }

    // Stops the writer, which drains what is left before it exits
    ~AsyncLogger() {
        writer_.request_stop();
        if (writer_.joinable()) {
            writer_.join();
        }
    }

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    template<LogArgument... Args>
    void log(LogLevel level, const char* fmt, Args... args) noexcept {
        if (level < min_level_.load(std::memory_order_relaxed)) {
            return;
        }

        std::lock_guard lock(publish_mutex_);
        const std::uint64_t seq = published_.load(std::memory_order_relaxed);
        if LOBSIM_UNLIKELY(seq - written_.load(std::memory_order_acquire) == BUFFER_SIZE) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        LogEntry& entry = slots_[seq % BUFFER_SIZE];
        entry.at = now_ns();
        entry.level = level;
        entry.length = static_cast<std::uint16_t>(format_into(entry.text, fmt, args...));

        published_.store(seq + 1, std::memory_order_release);
        logged_.fetch_add(1, std::memory_order_relaxed);
    }

    template<LogArgument... Args>
    void debug(const char* fmt, Args... args) noexcept { log(LogLevel::Debug, fmt, args...); }

    template<LogArgument... Args>
    void info(const char* fmt, Args... args) noexcept { log(LogLevel::Info, fmt, args...); }

    template<LogArgument... Args>
    void warn(const char* fmt, Args... args) noexcept { log(LogLevel::Warn, fmt, args...); }

    template<LogArgument... Args>
    void error(const char* fmt, Args... args) noexcept { log(LogLevel::Error, fmt, args...); }

    /**
     * @brief Write every published entry now, on the calling thread
     */
    void flush() {
        std::lock_guard lock(file_mutex_);

        std::uint64_t seq = written_.load(std::memory_order_relaxed);
        const std::uint64_t end = published_.load(std::memory_order_acquire);
        for (; seq != end; ++seq) {
            const LogEntry& entry = slots_[seq % BUFFER_SIZE];
            const auto since_open = static_cast<Duration>(entry.at - opened_at_);
            file_ << '+' << since_open / 1000 << " [" << to_string(entry.level) << "] "
                  << entry.view() << '\n';
        }

        written_.store(end, std::memory_order_release);
        file_.flush();
    }

    void set_min_level(LogLevel level) noexcept { min_level_.store(level, std::memory_order_relaxed); }

    [[nodiscard]] LogLevel min_level() const noexcept { return min_level_.load(std::memory_order_relaxed); }

    [[nodiscard]] std::uint64_t messages_logged() const noexcept {
        return logged_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t messages_dropped() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    template<typename... Args>
    static std::size_t format_into(std::array<char, LogEntry::TEXT_CAPACITY>& out,
                                   const char* fmt, Args... args) noexcept {
        constexpr std::size_t limit = LogEntry::TEXT_CAPACITY - 1;
        if constexpr (sizeof...(Args) == 0) {
            const std::size_t n = std::min(std::strlen(fmt), limit);
            std::memcpy(out.data(), fmt, n);
            out[n] = '\0';
            return n;
        } else {
            const int n = std::snprintf(out.data(), out.size(), fmt, args...);
            return n > 0 ? std::min(static_cast<std::size_t>(n), limit) : 0;
        }
    }

    void run_writer(std::stop_token stop) {
        while (!stop.stop_requested()) {
            {
                std::unique_lock lock(wake_mutex_);
                // Returns early when stop is requested
                wake_.wait_for(lock, stop, flush_interval_, [] { return false; });
            }
            flush();
        }
        flush();
    }
};

} // namespace lobsim
