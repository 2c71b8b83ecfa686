#include "bucket_store_redis.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <utility>

namespace {

// KEYS[1] tokens, KEYS[2] last_refill; ARGV capacity, refill_rate, cost.
// Returns {granted (0|1), tokens as string}; strings keep the fraction
// that Lua->RESP integer conversion would drop.
constexpr const char* kTakeScript = R"LUA(
redis.replicate_commands()
local capacity = tonumber(ARGV[1])
local rate = tonumber(ARGV[2])
local cost = tonumber(ARGV[3])
local t = redis.call('TIME')
local now = tonumber(t[1]) + tonumber(t[2]) / 1000000
local tokens = tonumber(redis.call('GET', KEYS[1]))
local last = tonumber(redis.call('GET', KEYS[2]))
if tokens == nil or last == nil then
  tokens = capacity
  last = now
end
local elapsed = now - last
if elapsed < 0 then elapsed = 0 end
tokens = math.min(capacity, tokens + elapsed * rate)
local granted = 0
if tokens >= cost then
  tokens = tokens - cost
  granted = 1
end
local ttl = math.ceil(capacity / rate) * 2 + 60
redis.call('SET', KEYS[1], tostring(tokens), 'EX', ttl)
redis.call('SET', KEYS[2], tostring(now), 'EX', ttl)
return {granted, tostring(tokens)}
)LUA";

std::string num_arg(double v) {
    std::ostringstream os;
    os << std::setprecision(17) << v;
    return os.str();
}

BucketOutcome parse_outcome(const RedisReply& r) {
    if (r->type != REDIS_REPLY_ARRAY || r->elements != 2) {
        throw BucketStoreError("unexpected script reply shape");
    }
    const redisReply* g = r->element[0];
    const redisReply* t = r->element[1];
    BucketOutcome out;
    out.granted = (g->type == REDIS_REPLY_INTEGER && g->integer == 1);
    if (t->type == REDIS_REPLY_STRING && t->str) {
        out.tokens = std::strtod(std::string(t->str, t->len).c_str(), nullptr);
    }
    return out;
}

} // namespace

RedisBucketStore::RedisBucketStore(std::shared_ptr<RedisPool> pool)
    : pool_(std::move(pool)) {}

const char* RedisBucketStore::script_source() { return kTakeScript; }

std::string RedisBucketStore::load_script(redisContext* ctx) {
    RedisReply r(static_cast<redisReply*>(
        redisCommand(ctx, "SCRIPT LOAD %s", kTakeScript)));
    if (!r) throw BucketStoreError("SCRIPT LOAD: connection lost");
    if (r.is_error() || r->type != REDIS_REPLY_STRING) {
        throw BucketStoreError("SCRIPT LOAD: " + r.error_text());
    }
    std::string sha(r->str, r->len);
    std::lock_guard<std::mutex> lk(sha_m_);
    sha_ = sha;
    return sha;
}

BucketOutcome RedisBucketStore::take(const BucketParams& p, double cost) {
    RedisPool::Slot slot(*pool_);
    redisContext* ctx = slot.ctx();
    if (!ctx) throw BucketStoreError("redis unreachable");

    const std::string tokens_key = p.key + ":tokens";
    const std::string refill_key = p.key + ":last_refill";
    const std::string cap = num_arg(p.capacity);
    const std::string rate = num_arg(p.refill_rate);
    const std::string c = num_arg(cost);

    std::string sha;
    {
        std::lock_guard<std::mutex> lk(sha_m_);
        sha = sha_;
    }
    if (sha.empty()) sha = load_script(ctx);

    RedisReply r(static_cast<redisReply*>(redisCommand(
        ctx, "EVALSHA %s 2 %s %s %s %s %s", sha.c_str(),
        tokens_key.c_str(), refill_key.c_str(), cap.c_str(), rate.c_str(), c.c_str())));

    if (r.is_error() && r.error_text().rfind("NOSCRIPT", 0) == 0) {
        // Server restarted or script cache flushed: send the body once
        r = RedisReply(static_cast<redisReply*>(redisCommand(
            ctx, "EVAL %s 2 %s %s %s %s %s", kTakeScript,
            tokens_key.c_str(), refill_key.c_str(), cap.c_str(), rate.c_str(), c.c_str())));
        {
            std::lock_guard<std::mutex> lk(sha_m_);
            sha_.clear();
        }
    }
    if (!r) {
        slot.invalidate();
        throw BucketStoreError("redis command failed: connection lost");
    }
    if (r.is_error()) {
        throw BucketStoreError("redis script error: " + r.error_text());
    }
    return parse_outcome(r);
}
