#include "bucket_store.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <unordered_map>

namespace
{
    using Clock = std::chrono::steady_clock;

    struct Bucket {
        double tokens{0.0};
        Clock::time_point last{};
    };
}

class MemoryBucketStore final : public IBucketStore
{
    std::mutex mtx_;
    std::unordered_map<std::string, Bucket> buckets_;

public:
    BucketOutcome take(const BucketParams& p, double cost) override
    {
        const auto now = Clock::now();
        std::scoped_lock lk(mtx_);

        auto it = buckets_.find(p.key);
        if (it == buckets_.end()) {
            // A new bucket starts full
            it = buckets_.emplace(p.key, Bucket{p.capacity, now}).first;
        }
        Bucket& b = it->second;

        const double elapsed = std::max(0.0, std::chrono::duration<double>(now - b.last).count());
        b.tokens = std::min(p.capacity, b.tokens + elapsed * p.refill_rate);
        b.last = now;

        BucketOutcome out;
        if (b.tokens >= cost) {
            b.tokens -= cost;
            out.granted = true;
        }
        out.tokens = b.tokens;
        return out;
    }

    const char* name() const override { return "memory"; }
};

std::unique_ptr<IBucketStore> make_memory_bucket_store()
{
    return std::make_unique<MemoryBucketStore>();
}
