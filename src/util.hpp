#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

class Timer {
public:
    Timer() : start_time_(std::chrono::steady_clock::now()) {}

    // Elapsed time in milliseconds
    double elapsed_ms() const;

private:
    std::chrono::steady_clock::time_point start_time_;
};

// Thread-safe ring buffer of request latencies
class LatencyTracker {
public:
    explicit LatencyTracker(size_t buffer_size = 1000)
        : buffer_size_(buffer_size), samples_(buffer_size) {}

    void record(double latency_ms);

    // p in [0, 100], 0.0 when nothing was recorded yet
    double percentile(double p) const;

private:
    size_t buffer_size_;
    std::vector<double> samples_;
    mutable std::mutex mutex_;
    size_t next_ = 0;
    size_t count_ = 0;
};

// Requests per second over a rolling window
class QPSTracker {
public:
    explicit QPSTracker(std::chrono::seconds window = std::chrono::seconds(60)) : window_(window) {}

    void record();
    double get_qps() const;

private:
    std::chrono::seconds window_;
    mutable std::mutex mutex_;
    std::deque<std::chrono::steady_clock::time_point> timestamps_;
};

class UptimeTracker {
public:
    UptimeTracker() : start_time_(std::chrono::steady_clock::now()) {}

    double get_uptime_sec() const;

private:
    std::chrono::steady_clock::time_point start_time_;
};

// Writes "[YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] message" to stdout
void log_line(const std::string& level, const std::string& message);

// Structured logging for find_common_word queries
void log_query(double latency_ms, size_t top_n, size_t words, size_t returned, size_t vocab_size);

// Convenience macros
#define LOG_INFO(msg) log_line("INFO", msg)
#define LOG_WARN(msg) log_line("WARN", msg)
#define LOG_ERROR(msg) log_line("ERROR", msg)
#define LOG_DEBUG(msg) log_line("DEBUG", msg)
