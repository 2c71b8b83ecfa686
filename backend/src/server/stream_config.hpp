#pragma once
#include <chrono>
#include <cstddef>
#include <string>

#include "md/poll_schedule.hpp"
#include "ratelimit/token_bucket.hpp"
#include "redis/redis_pool.hpp"

struct StreamConfig {
    std::string app_env = "development";
    std::string host = "0.0.0.0";
    unsigned short port = 8080;
    int io_threads = 2;
    std::size_t send_queue_limit = 64;

    std::chrono::seconds poll_interval{5};
    std::chrono::seconds poll_interval_dev{5};
    std::chrono::seconds poll_interval_off_hours{60};

    TokenBucketLimiter::Options limiter;
    std::chrono::milliseconds acquire_timeout{2000};

    RedisOptions redis;
    std::string database_url;              // empty: in-memory demo data
    std::chrono::seconds quote_cache_ttl{5}; // 0 disables
    std::string upstream_base_url = "https://query1.finance.yahoo.com";

    bool development() const { return app_env != "production"; }

    PollSchedule poll_schedule() const;

    // Reads the environment; throws std::runtime_error on malformed values.
    static StreamConfig from_env();
};

// Loads KEY=VALUE lines into the environment without overwriting
// variables that are already set. Looks in ./ then ./backend/.
void load_env_file(const std::string& filepath = ".env");
