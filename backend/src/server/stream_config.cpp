#include "server/stream_config.hpp"

#include <cstdlib>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace {

std::string env_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return (v && *v) ? std::string(v) : def;
}

long long env_int(const char* key, long long def, long long lo, long long hi) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    std::size_t pos = 0;
    long long out = 0;
    try {
        out = std::stoll(v, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(key) + ": not an integer: " + v);
    }
    if (v[pos] != '\0') throw std::runtime_error(std::string(key) + ": not an integer: " + v);
    if (out < lo || out > hi) throw std::runtime_error(std::string(key) + ": out of range: " + v);
    return out;
}

double env_double(const char* key, double def, double lo) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    std::size_t pos = 0;
    double out = 0.0;
    try {
        out = std::stod(v, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(key) + ": not a number: " + v);
    }
    if (v[pos] != '\0' || !(out > 0.0)) {
        throw std::runtime_error(std::string(key) + ": expected a positive number: " + v);
    }
    if (out < lo) throw std::runtime_error(std::string(key) + ": out of range: " + v);
    return out;
}

} // namespace

PollSchedule StreamConfig::poll_schedule() const {
    PollSchedule s;
    s.development = development();
    s.dev_interval = poll_interval_dev;
    s.trading_interval = poll_interval;
    s.off_hours_interval = poll_interval_off_hours;
    s.calendar = std::make_shared<const TradingCalendar>();
    return s;
}

StreamConfig StreamConfig::from_env() {
    StreamConfig c;
    c.app_env = env_or("APP_ENV", c.app_env);
    c.host = env_or("STREAM_HOST", c.host);
    c.port = static_cast<unsigned short>(env_int("STREAM_PORT", c.port, 1, 65535));
    c.io_threads = static_cast<int>(env_int("STREAM_IO_THREADS", c.io_threads, 1, 256));
    c.send_queue_limit = static_cast<std::size_t>(env_int("SEND_QUEUE_LIMIT", 64, 1, 100000));

    c.poll_interval = std::chrono::seconds(env_int("POLL_INTERVAL_SEC", 5, 1, 86400));
    c.poll_interval_dev = std::chrono::seconds(env_int("POLL_INTERVAL_DEV_SEC", 5, 1, 86400));
    c.poll_interval_off_hours =
        std::chrono::seconds(env_int("POLL_INTERVAL_OFF_HOURS_SEC", 60, 1, 86400));

    c.limiter.key = env_or("RATE_LIMIT_KEY", c.limiter.key);
    // Every upstream request costs one token
    c.limiter.capacity = env_double("RATE_LIMIT_CAPACITY", c.limiter.capacity, 1.0);
    c.limiter.refill_rate = env_double("RATE_LIMIT_REFILL_PER_SEC", c.limiter.refill_rate, 0.0);
    c.acquire_timeout =
        std::chrono::milliseconds(env_int("RATE_LIMIT_ACQUIRE_TIMEOUT_MS", 2000, 0, 600000));
    const std::string mode = env_or("RATE_LIMIT_DEGRADED_MODE", "deny");
    if (mode == "deny") {
        c.limiter.degraded = DegradedMode::Deny;
    } else if (mode == "local") {
        c.limiter.degraded = DegradedMode::LocalFallback;
    } else {
        throw std::runtime_error("RATE_LIMIT_DEGRADED_MODE: expected 'deny' or 'local', got " + mode);
    }

    c.redis.host = env_or("REDIS_HOST", c.redis.host);
    c.redis.port = static_cast<int>(env_int("REDIS_PORT", c.redis.port, 1, 65535));
    c.redis.db = static_cast<int>(env_int("REDIS_DB", c.redis.db, 0, 1024));
    c.redis.password = env_or("REDIS_PASSWORD", "");
    c.redis.pool_size = static_cast<int>(env_int("REDIS_POOL_SIZE", c.redis.pool_size, 1, 1024));
    c.redis.timeout_ms = static_cast<int>(env_int("REDIS_TIMEOUT_MS", c.redis.timeout_ms, 1, 60000));

    c.database_url = env_or("DATABASE_URL", "");
    c.quote_cache_ttl = std::chrono::seconds(env_int("QUOTE_CACHE_TTL_SEC", 5, 0, 86400));
    c.upstream_base_url = env_or("UPSTREAM_BASE_URL", c.upstream_base_url);
    return c;
}

void load_env_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        file.open("backend/" + filepath);
        if (!file.is_open()) return; // environment only
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r") + 1);
        if (key.empty()) continue;

        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }

        setenv(key.c_str(), value.c_str(), 0); // existing variables win
    }
}
