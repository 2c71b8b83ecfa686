#include "token_bucket.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace {
// Longest uninterrupted sleep, so cancellation is noticed promptly
constexpr std::chrono::milliseconds kSleepSlice{20};
}

TokenBucketLimiter::TokenBucketLimiter(std::shared_ptr<IBucketStore> store, Options opts)
    : store_(std::move(store)), opts_(std::move(opts))
{
    if (!store_) throw std::invalid_argument("bucket store is required");
    if (opts_.capacity <= 0.0) throw std::invalid_argument("capacity must be positive");
    if (opts_.refill_rate <= 0.0) throw std::invalid_argument("refill rate must be positive");

    params_.key = opts_.key;
    params_.capacity = opts_.capacity;
    params_.refill_rate = opts_.refill_rate;

    std::cout << "[limiter] key=" << opts_.key << " capacity=" << opts_.capacity
              << " refill=" << opts_.refill_rate << "/s store=" << store_->name()
              << " degraded=" << to_cstr(opts_.degraded) << std::endl;
}

AcquireResult TokenBucketLimiter::acquire(double cost,
                                          std::chrono::milliseconds timeout,
                                          const std::atomic<bool>* cancel)
{
    if (cost <= 0.0) {
        throw std::invalid_argument("token cost must be positive");
    }
    if (cost > opts_.capacity) {
        std::ostringstream os;
        os << "Cannot acquire " << cost << " tokens (capacity " << opts_.capacity << ")";
        throw std::invalid_argument(os.str());
    }

    const auto deadline = Clock::now() + timeout;

    for (;;) {
        if (cancel && cancel->load(std::memory_order_relaxed)) return AcquireResult::Cancelled;

        BucketOutcome out;
        try {
            out = store_->take(params_, cost);
        } catch (const BucketStoreError& e) {
            note_store_down(e);
            if (opts_.degraded == DegradedMode::LocalFallback) {
                return acquire_local(cost, deadline, cancel);
            }
            // Deny: nothing is granted, but the store may come back before the deadline
            const auto now = Clock::now();
            if (now >= deadline) return AcquireResult::TimedOut;
            if (!sleep_until(std::min(now + opts_.store_retry_interval, deadline), cancel)) {
                return AcquireResult::Cancelled;
            }
            if (Clock::now() >= deadline) return AcquireResult::TimedOut;
            continue;
        }
        note_store_up();

        if (out.granted) return AcquireResult::Granted;

        const auto now = Clock::now();
        if (now >= deadline) return AcquireResult::TimedOut;

        // Time until enough tokens have dripped in, capped by the deadline
        const std::chrono::duration<double> wait((cost - out.tokens) / opts_.refill_rate);
        auto wake = now + std::chrono::duration_cast<Clock::duration>(wait);
        if (wake > deadline) wake = deadline;
        if (!sleep_until(wake, cancel)) return AcquireResult::Cancelled;
    }
}

AcquireResult TokenBucketLimiter::acquire_local(double cost,
                                                Clock::time_point deadline,
                                                const std::atomic<bool>* cancel)
{
    Clock::time_point slot;
    {
        std::lock_guard<std::mutex> lk(local_m_);
        const auto start = std::max(Clock::now(), local_next_);
        if (start > deadline) return AcquireResult::TimedOut;
        const std::chrono::duration<double> spacing(cost / opts_.refill_rate);
        local_next_ = start + std::chrono::duration_cast<Clock::duration>(spacing);
        slot = start;
    }
    if (!sleep_until(slot, cancel)) return AcquireResult::Cancelled;
    return AcquireResult::Granted;
}

LimiterStats TokenBucketLimiter::get_stats()
{
    LimiterStats s;
    s.capacity = opts_.capacity;
    s.refill_rate = opts_.refill_rate;
    try {
        s.current_tokens = store_->take(params_, 0.0).tokens;
        note_store_up();
    } catch (const BucketStoreError& e) {
        note_store_down(e);
        s.store_available = false;
        s.current_tokens = 0.0;
    }
    s.utilization_percent = (opts_.capacity - s.current_tokens) / opts_.capacity * 100.0;
    return s;
}

void TokenBucketLimiter::note_store_down(const std::exception& e)
{
    if (!store_down_.exchange(true)) {
        std::cerr << "[limiter] store '" << store_->name() << "' unavailable (" << e.what()
                  << "); degraded mode: " << to_cstr(opts_.degraded) << std::endl;
    }
}

void TokenBucketLimiter::note_store_up()
{
    if (store_down_.exchange(false)) {
        std::cout << "[limiter] store '" << store_->name() << "' reachable again" << std::endl;
    }
}

bool TokenBucketLimiter::sleep_until(Clock::time_point until, const std::atomic<bool>* cancel)
{
    for (;;) {
        if (cancel && cancel->load(std::memory_order_relaxed)) return false;
        const auto now = Clock::now();
        if (now >= until) return true;
        std::this_thread::sleep_for(std::min<Clock::duration>(until - now, kSleepSlice));
    }
}
