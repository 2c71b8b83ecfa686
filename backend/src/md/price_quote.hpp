#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

// One symbol's upstream data for one poll cycle. A quote without a price
// is the "unavailable" marker; it is not an error.
struct PriceQuote {
    std::string symbol;                  // canonical, e.g. "7203"
    std::optional<double> price;         // latest close
    std::optional<double> previous_close;
    std::int64_t ts_ms{0};               // wall clock, ms since epoch

    bool available() const { return price.has_value(); }

    static PriceQuote unavailable(std::string sym, std::int64_t ts_ms = 0) {
        PriceQuote q;
        q.symbol = std::move(sym);
        q.ts_ms = ts_ms;
        return q;
    }
};

using QuoteMap = std::unordered_map<std::string, PriceQuote>;
