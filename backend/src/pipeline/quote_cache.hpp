#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "md/price_quote.hpp"
#include "redis/redis_pool.hpp"

// Short-lived quote cache shared by every broadcaster process. Failures
// are misses, never errors.
class IQuoteCache {
public:
    virtual ~IQuoteCache() = default;
    virtual std::optional<PriceQuote> get(const std::string& ticker) = 0;
    virtual void put(const std::string& ticker, const PriceQuote& q) = 0;
};

// "yahoo_finance:<ticker>:price" -> {"ticker","close_price","previous_close",...}
// via SETEX, the layout the rest of the platform reads and writes.
class RedisQuoteCache final : public IQuoteCache {
public:
    RedisQuoteCache(std::shared_ptr<RedisPool> pool, std::chrono::seconds ttl);

    std::optional<PriceQuote> get(const std::string& ticker) override;
    void put(const std::string& ticker, const PriceQuote& q) override;

    static std::string key_for(const std::string& ticker);
    static std::string encode(const PriceQuote& q);
    static std::optional<PriceQuote> decode(const std::string& doc);

private:
    std::shared_ptr<RedisPool> pool_;
    std::chrono::seconds ttl_;
};
