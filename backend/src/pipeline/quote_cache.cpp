#include "pipeline/quote_cache.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <utility>

#include "md/symbol_codec.hpp"
#include "stream/price_update.hpp"

using json = nlohmann::json;

RedisQuoteCache::RedisQuoteCache(std::shared_ptr<RedisPool> pool, std::chrono::seconds ttl)
    : pool_(std::move(pool)), ttl_(ttl) {}

std::string RedisQuoteCache::key_for(const std::string& ticker) {
    return "yahoo_finance:" + ticker + ":price";
}

std::string RedisQuoteCache::encode(const PriceQuote& q) {
    // Same document the batch jobs write, so both sides read each other's entries
    json j;
    j["ticker"] = SymbolCodec::to_canonical("yahoo", q.symbol);
    j["formatted_ticker"] = SymbolCodec::to_provider("yahoo", q.symbol);
    j["close_price"] = q.price ? json(*q.price) : json(nullptr);
    j["previous_close"] = q.previous_close ? json(*q.previous_close) : json(nullptr);
    j["currency"] = "JPY";
    j["updated_at"] = iso8601_utc(q.ts_ms);
    j["ts_ms"] = q.ts_ms;
    return j.dump();
}

std::optional<PriceQuote> RedisQuoteCache::decode(const std::string& doc) {
    json j = json::parse(doc, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    PriceQuote q;
    if (j.contains("ticker") && j["ticker"].is_string()) {
        q.symbol = SymbolCodec::to_canonical("yahoo", j["ticker"].get<std::string>());
    }
    if (j.contains("close_price") && j["close_price"].is_number()) {
        q.price = j["close_price"].get<double>();
    }
    if (j.contains("previous_close") && j["previous_close"].is_number()) {
        q.previous_close = j["previous_close"].get<double>();
    }
    if (j.contains("ts_ms") && j["ts_ms"].is_number_integer()) {
        q.ts_ms = j["ts_ms"].get<std::int64_t>();
    }
    // An entry without a close price is refetched rather than served
    if (!q.available()) return std::nullopt;
    return q;
}

std::optional<PriceQuote> RedisQuoteCache::get(const std::string& ticker) {
    RedisPool::Slot slot(*pool_);
    redisContext* ctx = slot.ctx();
    if (!ctx) return std::nullopt;

    const std::string key = key_for(ticker);
    RedisReply r(static_cast<redisReply*>(redisCommand(ctx, "GET %b", key.data(), key.size())));
    if (!r) {
        slot.invalidate();
        return std::nullopt;
    }
    if (r->type != REDIS_REPLY_STRING) return std::nullopt;
    return decode(std::string(r->str, r->len));
}

void RedisQuoteCache::put(const std::string& ticker, const PriceQuote& q) {
    if (!q.available() || ttl_.count() <= 0) return;

    RedisPool::Slot slot(*pool_);
    redisContext* ctx = slot.ctx();
    if (!ctx) return;

    const std::string key = key_for(ticker);
    const std::string body = encode(q);
    RedisReply r(static_cast<redisReply*>(redisCommand(
        ctx, "SETEX %b %lld %b", key.data(), key.size(),
        static_cast<long long>(ttl_.count()), body.data(), body.size())));
    if (!r) {
        slot.invalidate();
        std::cerr << "[cache] SETEX " << key << ": connection lost" << std::endl;
    } else if (r.is_error()) {
        std::cerr << "[cache] SETEX " << key << ": " << r.error_text() << std::endl;
    }
}
