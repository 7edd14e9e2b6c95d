#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

double Timer::elapsed_ms() const {
    auto now = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(now - start_time_);
    return duration.count() / 1000.0;
}

void LatencyTracker::record(double latency_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_[next_] = latency_ms;
    next_ = (next_ + 1) % buffer_size_;
    count_ = std::min(count_ + 1, buffer_size_);
}

double LatencyTracker::percentile(double p) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count_ == 0) return 0.0;

    std::vector<double> sorted(samples_.begin(), samples_.begin() + count_);
    std::sort(sorted.begin(), sorted.end());

    // Nearest-rank
    double rank = std::ceil(p * count_ / 100.0);
    size_t idx = rank < 1.0 ? 0 : static_cast<size_t>(rank) - 1;
    idx = std::min(idx, count_ - 1);
    return sorted[idx];
}

void QPSTracker::record() {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);

    auto cutoff = now - window_;
    while (!timestamps_.empty() && timestamps_.front() < cutoff) {
        timestamps_.pop_front();
    }
    timestamps_.push_back(now);
}

double QPSTracker::get_qps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timestamps_.empty()) return 0.0;

    auto now = std::chrono::steady_clock::now();
    auto cutoff = now - window_;

    size_t count = std::count_if(timestamps_.begin(), timestamps_.end(),
                                 [&cutoff](const std::chrono::steady_clock::time_point& ts) {
                                     return ts >= cutoff;
                                 });

    double window_sec = std::chrono::duration<double>(now - std::max(cutoff, timestamps_.front())).count();
    return window_sec > 0 ? count / window_sec : 0.0;
}

double UptimeTracker::get_uptime_sec() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();
}

void log_line(const std::string& level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::stringstream ss;
    ss << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    ss << " [" << level << "] " << message;

    std::cout << ss.str() << std::endl;
}

void log_query(double latency_ms, size_t top_n, size_t words, size_t returned, size_t vocab_size) {
    std::stringstream ss;
    ss << "{"
       << "\"lat_ms\":" << std::fixed << std::setprecision(2) << latency_ms << ","
       << "\"top_n\":" << top_n << ","
       << "\"words\":" << words << ","
       << "\"returned\":" << returned << ","
       << "\"vocab\":" << vocab_size
       << "}";
    log_line("QUERY", ss.str());
}
