#pragma once
#include <boost/url.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <string_view>

#include "ratelimit/token_bucket.hpp"
#include "stream/connection_gateway.hpp"
#include "stream/connection_registry.hpp"

namespace http  = boost::beast::http;
namespace urls  = boost::urls;

struct StreamProbes {
    ConnectionRegistry& registry;
    TokenBucketLimiter& limiter;
};

inline nlohmann::json stats_json(StreamProbes& p)
{
    const RegistryStats rs = p.registry.stats();
    const LimiterStats ls = p.limiter.get_stats();
    return {
        {"topics", rs.topics},
        {"connections", rs.connections},
        {"workers", rs.workers},
        {"rate_limiter", {
            {"current_tokens", ls.current_tokens},
            {"max_tokens", ls.capacity},
            {"refill_rate", ls.refill_rate},
            {"utilization_percent", std::round(ls.utilization_percent * 100.0) / 100.0},
            {"store_available", ls.store_available},
        }},
    };
}

inline void handle_request(StreamProbes& probes,
                           const http::request<http::string_body>& req,
                           http::response<http::string_body>& res)
{
    res.set(http::field::server, "watchlist-stream/0.1");
    res.set(http::field::content_type, "application/json");

    std::string_view target{req.target().data(), req.target().size()};
    auto parsed_result = urls::parse_origin_form(target);
    if (!parsed_result) {
        res.result(http::status::bad_request);
        res.body() = R"({"error":"bad request"})";
        return;
    }

    urls::url_view url = *parsed_result;

    // /api/health
    if (req.method() == http::verb::get && url.path() == "/api/health") {
        res.result(http::status::ok);
        res.body() = R"({"status":"ok"})";
        return;
    }

    // /api/v1/ws/stats
    if (req.method() == http::verb::get && url.path() == "/api/v1/ws/stats") {
        res.result(http::status::ok);
        res.body() = stats_json(probes).dump();
        return;
    }

    // The stream path without an Upgrade header
    if (url.path().starts_with(ConnectionGateway::kPathPrefix)) {
        res.result(http::status::upgrade_required);
        res.body() = R"({"error":"websocket upgrade required"})";
        return;
    }

    // 404
    res.result(http::status::not_found);
    res.body() = R"({"error":"not found"})";
}
