#pragma once
#include <memory>
#include <mutex>
#include <string>

#include "bucket_store.hpp"
#include "redis/redis_pool.hpp"

// Token bucket kept in two Redis keys, "<key>:tokens" and "<key>:last_refill",
// updated by one Lua script so every process sharing the server sees a
// single atomic refill-and-consume. The script reads the server clock, so
// callers on different hosts need not agree on time.
class RedisBucketStore final : public IBucketStore {
public:
    explicit RedisBucketStore(std::shared_ptr<RedisPool> pool);

    BucketOutcome take(const BucketParams& p, double cost) override;
    const char* name() const override { return "redis"; }

    static const char* script_source();

private:
    std::string load_script(redisContext* ctx);

    std::shared_ptr<RedisPool> pool_;
    std::mutex sha_m_;
    std::string sha_;
};
