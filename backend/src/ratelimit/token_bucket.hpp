#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "bucket_store.hpp"

enum class AcquireResult { Granted, TimedOut, Cancelled };

inline const char* to_cstr(AcquireResult r) {
    switch (r) {
        case AcquireResult::Granted: return "granted";
        case AcquireResult::TimedOut: return "timed_out";
        case AcquireResult::Cancelled: return "cancelled";
    }
    return "?";
}

// What to do while the shared store cannot be reached.
enum class DegradedMode {
    Deny,         // grant nothing; keep probing the store until the deadline
    LocalFallback // process-local fixed-delay throttle at the configured rate
};

inline const char* to_cstr(DegradedMode m) {
    return m == DegradedMode::Deny ? "deny" : "local";
}

struct LimiterStats {
    double current_tokens{0.0};
    double capacity{0.0};
    double refill_rate{0.0};
    double utilization_percent{0.0};
    bool store_available{true};
};

// Distributed token bucket. Every acquire() is a single atomic
// refill-and-consume on the store; waits for refill happen here, outside
// the store. Thread-safe.
class TokenBucketLimiter {
public:
    struct Options {
        std::string key = "rate_limit:yahoo_api";
        double capacity = 100.0;
        double refill_rate = 0.5;   // tokens per second
        DegradedMode degraded = DegradedMode::Deny;
        // Store retry period while degraded in Deny mode
        std::chrono::milliseconds store_retry_interval{250};
    };

    TokenBucketLimiter(std::shared_ptr<IBucketStore> store, Options opts);

    // Blocks until `cost` tokens are taken, `timeout` elapses, or *cancel
    // becomes true. Throws std::invalid_argument if cost <= 0 or > capacity.
    AcquireResult acquire(double cost = 1.0,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds{5000},
                          const std::atomic<bool>* cancel = nullptr);

    // Refill-on-read without consuming.
    LimiterStats get_stats();

    const Options& options() const { return opts_; }

private:
    using Clock = std::chrono::steady_clock;

    AcquireResult acquire_local(double cost, Clock::time_point deadline,
                                const std::atomic<bool>* cancel);
    void note_store_down(const std::exception& e);
    void note_store_up();

    // Sleeps until `until`, waking early on cancellation. False if cancelled.
    static bool sleep_until(Clock::time_point until, const std::atomic<bool>* cancel);

    std::shared_ptr<IBucketStore> store_;
    Options opts_;
    BucketParams params_;

    std::atomic<bool> store_down_{false};

    std::mutex local_m_;
    Clock::time_point local_next_{};
};
