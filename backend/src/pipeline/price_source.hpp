#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "md/price_quote.hpp"
#include "pipeline/quote_cache.hpp"
#include "ratelimit/token_bucket.hpp"
#include "upstream/price_provider.hpp"

// Rate-limited access to the upstream provider. Every upstream request
// first takes one token from the shared limiter; a cache hit costs nothing.
class PriceSource {
public:
    struct Options {
        std::chrono::milliseconds acquire_timeout{2000};
    };

    PriceSource(std::shared_ptr<IPriceProvider> provider,
                std::shared_ptr<TokenBucketLimiter> limiter,
                std::shared_ptr<IQuoteCache> cache,   // may be null
                Options opts);  // throws std::invalid_argument if capacity < 1

    // One entry per requested symbol, unavailable where the limiter refused,
    // the provider failed or the provider had no price. Never throws for
    // upstream trouble. Stops early if *cancel is raised.
    QuoteMap fetch(const std::vector<std::string>& symbols,
                   const std::atomic<bool>* cancel = nullptr);

    TokenBucketLimiter& limiter() { return *limiter_; }

private:
    std::shared_ptr<IPriceProvider> provider_;
    std::shared_ptr<TokenBucketLimiter> limiter_;
    std::shared_ptr<IQuoteCache> cache_;
    Options opts_;
};
