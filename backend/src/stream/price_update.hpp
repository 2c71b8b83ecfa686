#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "access/data_access.hpp"
#include "md/price_quote.hpp"

struct PriceItem {
    std::string symbol;
    std::string name;
    std::optional<double> price;
    std::optional<double> delta;          // price - previous close
    std::optional<double> delta_percent;
    std::optional<double> quantity;
    std::optional<double> purchase_price;
    std::optional<double> unrealized_pnl; // (price - purchase_price) * quantity
};

// One frame for every subscriber of a topic.
struct PriceUpdate {
    TopicId topic_id{0};
    std::vector<PriceItem> items;  // watchlist order
    std::int64_t ts_ms{0};         // when the frame was built
};

// Items follow the watchlist order; a symbol missing from `quotes` gets nulls.
PriceUpdate merge_quotes(const TopicView& topic, const QuoteMap& quotes, std::int64_t ts_ms);

// {"type":"price_update","topic_id":..,"items":[..],"timestamp":"...Z"}
std::string to_json(const PriceUpdate& u);

// 2025-11-09T12:00:00.123Z
std::string iso8601_utc(std::int64_t ts_ms);

double round2(double v);
