#include "../src/ratelimit/bucket_store_redis.hpp"
#include "../src/ratelimit/token_bucket.hpp"
#include "../src/redis/redis_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

// Needs a live server: REDIS_HOST (and optionally REDIS_PORT) must be set.
int main() {
    const char* host = std::getenv("REDIS_HOST");
    if (!host || !*host) {
        std::cout << "SKIP (REDIS_HOST not set)\n";
        return 0;
    }

    RedisOptions ro;
    ro.host = host;
    if (const char* port = std::getenv("REDIS_PORT")) ro.port = std::atoi(port);
    ro.pool_size = 12;
    ro.timeout_ms = 1000;
    auto pool = std::make_shared<RedisPool>(ro);
    auto store = std::make_shared<RedisBucketStore>(pool);

    const std::string key = "test:rate_limit:" + std::to_string(::getpid()) + ":" +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    BucketParams p{key, 5.0, 0.001};

    // Fresh bucket starts full; cost 0 only reports
    BucketOutcome peek = store->take(p, 0.0);
    assert(peek.tokens <= 5.0 && peek.tokens >= 4.99);

    // Contention: K callers, K-1 tokens
    assert(store->take(p, 1.0).granted);
    const int K = 5;
    std::atomic<int> granted{0};
    std::vector<std::thread> ts;
    for (int i = 0; i < K; ++i) {
        ts.emplace_back([&] {
            if (store->take(p, 1.0).granted) ++granted;
        });
    }
    for (auto& t : ts) t.join();
    assert(granted == K - 1);

    BucketOutcome after = store->take(p, 0.0);
    assert(after.tokens >= 0.0 && after.tokens < 1.0);

    // Both keys exist and carry a TTL
    {
        RedisPool::Slot slot(*pool);
        redisContext* ctx = slot.ctx();
        assert(ctx);
        for (const std::string suffix : {":tokens", ":last_refill"}) {
            const std::string k = key + suffix;
            RedisReply ttl(static_cast<redisReply*>(redisCommand(ctx, "TTL %s", k.c_str())));
            assert(ttl && ttl->type == REDIS_REPLY_INTEGER && ttl->integer > 0);
        }
    }

    // Flushed script cache falls back to EVAL
    {
        RedisPool::Slot slot(*pool);
        RedisReply r(static_cast<redisReply*>(redisCommand(slot.ctx(), "SCRIPT FLUSH")));
        assert(r && !r.is_error());
    }
    BucketOutcome again = store->take(p, 0.0);
    assert(again.tokens >= 0.0 && again.tokens <= 5.0);

    // Limiter over the shared store: refill never exceeds capacity
    BucketParams fast{key + ":fast", 3.0, 100.0};
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    BucketOutcome full = store->take(fast, 0.0);
    assert(full.tokens <= 3.0);

    TokenBucketLimiter::Options lo;
    lo.key = key + ":limiter";
    lo.capacity = 2;
    lo.refill_rate = 10;
    TokenBucketLimiter lim(store, lo);
    assert(lim.acquire(1, std::chrono::milliseconds(0)) == AcquireResult::Granted);
    assert(lim.acquire(1, std::chrono::milliseconds(0)) == AcquireResult::Granted);
    assert(lim.acquire(1, std::chrono::milliseconds(500)) == AcquireResult::Granted);
    LimiterStats s = lim.get_stats();
    assert(s.store_available && s.current_tokens >= 0.0 && s.current_tokens <= 2.0);

    // Cleanup
    {
        RedisPool::Slot slot(*pool);
        for (const std::string k : {key + ":tokens", key + ":last_refill",
                                    key + ":fast:tokens", key + ":fast:last_refill",
                                    key + ":limiter:tokens", key + ":limiter:last_refill"}) {
            RedisReply r(static_cast<redisReply*>(redisCommand(slot.ctx(), "DEL %s", k.c_str())));
        }
    }

    std::cout << "OK\n";
    return 0;
}
