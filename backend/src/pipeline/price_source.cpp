#include "pipeline/price_source.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "md/symbol_codec.hpp"

namespace {
constexpr double kRequestCost = 1.0;

std::int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
}

PriceSource::PriceSource(std::shared_ptr<IPriceProvider> provider,
                         std::shared_ptr<TokenBucketLimiter> limiter,
                         std::shared_ptr<IQuoteCache> cache,
                         Options opts)
    : provider_(std::move(provider)), limiter_(std::move(limiter)),
      cache_(std::move(cache)), opts_(opts)
{
    if (!provider_ || !limiter_) throw std::invalid_argument("price source needs a provider and a limiter");
    if (limiter_->options().capacity < kRequestCost) {
        throw std::invalid_argument("rate limit capacity must hold at least one request");
    }
}

QuoteMap PriceSource::fetch(const std::vector<std::string>& symbols,
                            const std::atomic<bool>* cancel)
{
    QuoteMap out;
    std::size_t priced = 0, throttled = 0, failed = 0;

    for (const auto& sym : symbols) {
        if (out.count(sym)) continue;
        if (cancel && cancel->load()) break;

        const std::string ticker = SymbolCodec::to_provider("yahoo", sym);
        if (cache_) {
            if (auto hit = cache_->get(ticker)) {
                hit->symbol = sym;
                out[sym] = std::move(*hit);
                ++priced;
                continue;
            }
        }

        const AcquireResult ar = limiter_->acquire(kRequestCost, opts_.acquire_timeout, cancel);
        if (ar == AcquireResult::Cancelled) break;
        if (ar == AcquireResult::TimedOut) {
            ++throttled;
            out[sym] = PriceQuote::unavailable(sym, now_ms());
            continue;
        }

        try {
            QuoteMap got = provider_->fetch({sym});
            auto it = got.find(sym);
            PriceQuote q = (it != got.end()) ? std::move(it->second)
                                             : PriceQuote::unavailable(sym, now_ms());
            if (q.available()) {
                ++priced;
                if (cache_) cache_->put(ticker, q);
            }
            out[sym] = std::move(q);
        } catch (const ProviderError& e) {
            ++failed;
            std::cerr << "[prices] " << sym << ": " << e.what() << std::endl;
            out[sym] = PriceQuote::unavailable(sym, now_ms());
        }
    }

    // Fill anything skipped by cancellation so callers always get every symbol
    for (const auto& sym : symbols) {
        if (!out.count(sym)) out[sym] = PriceQuote::unavailable(sym, now_ms());
    }

    if (!symbols.empty() && priced == 0 && !(cancel && cancel->load())) {
        std::cerr << "[prices] no quotes for " << symbols.size() << " symbol(s)"
                  << " (throttled=" << throttled << " failed=" << failed << ")" << std::endl;
    } else if (throttled > 0) {
        std::cerr << "[prices] rate limiter refused " << throttled << " request(s)" << std::endl;
    }
    return out;
}
