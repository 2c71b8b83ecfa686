#include "stream/price_update.hpp"

#include <nlohmann/json.hpp>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace {
json opt(const std::optional<double>& v) {
    return v ? json(*v) : json(nullptr);
}
}

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

PriceUpdate merge_quotes(const TopicView& topic, const QuoteMap& quotes, std::int64_t ts_ms) {
    PriceUpdate u;
    u.topic_id = topic.topic_id;
    u.ts_ms = ts_ms;
    u.items.reserve(topic.items.size());

    for (const auto& ti : topic.items) {
        PriceItem it;
        it.symbol = ti.symbol;
        it.name = ti.name;
        it.quantity = ti.quantity;
        it.purchase_price = ti.purchase_price;

        auto q = quotes.find(ti.symbol);
        if (q != quotes.end() && q->second.available()) {
            const double px = *q->second.price;
            it.price = px;
            if (q->second.previous_close) {
                const double prev = *q->second.previous_close;
                it.delta = round2(px - prev);
                if (prev != 0.0) it.delta_percent = round2((px - prev) / prev * 100.0);
            }
            if (ti.quantity && ti.purchase_price) {
                it.unrealized_pnl = round2((px - *ti.purchase_price) * *ti.quantity);
            }
        }
        u.items.push_back(std::move(it));
    }
    return u;
}

std::string iso8601_utc(std::int64_t ts_ms) {
    const std::time_t secs = static_cast<std::time_t>(ts_ms / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << (ts_ms % 1000) << 'Z';
    return os.str();
}

std::string to_json(const PriceUpdate& u) {
    json items = json::array();
    for (const auto& it : u.items) {
        items.push_back({
            {"symbol", it.symbol},
            {"name", it.name},
            {"price", opt(it.price)},
            {"delta", opt(it.delta)},
            {"delta_percent", opt(it.delta_percent)},
            {"quantity", opt(it.quantity)},
            {"purchase_price", opt(it.purchase_price)},
            {"unrealized_pnl", opt(it.unrealized_pnl)},
        });
    }
    json j = {
        {"type", "price_update"},
        {"topic_id", u.topic_id},
        {"items", std::move(items)},
        {"timestamp", iso8601_utc(u.ts_ms)},
    };
    return j.dump();
}
