#include "auth/session_verifier_redis.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <utility>

using json = nlohmann::json;

RedisSessionVerifier::RedisSessionVerifier(std::shared_ptr<RedisPool> pool)
    : pool_(std::move(pool)) {}

std::optional<UserId> RedisSessionVerifier::parse_session(const std::string& doc) {
    json j = json::parse(doc, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    auto it = j.find("user_id");
    if (it == j.end()) return std::nullopt;
    if (it->is_number_integer()) return it->get<UserId>();
    if (it->is_string()) {
        // some writers store ids as strings
        try {
            std::size_t pos = 0;
            const std::string s = it->get<std::string>();
            UserId id = std::stoll(s, &pos);
            if (pos == s.size()) return id;
        } catch (const std::exception&) {
        }
    }
    return std::nullopt;
}

VerifyResult RedisSessionVerifier::verify(const std::string& token) {
    if (token.empty()) return VerifyError::Rejected;

    RedisPool::Slot slot(*pool_);
    redisContext* ctx = slot.ctx();
    if (!ctx) return VerifyError::Unavailable;

    const std::string key = "session:" + token;
    RedisReply r(static_cast<redisReply*>(redisCommand(ctx, "GET %b", key.data(), key.size())));
    if (!r) {
        slot.invalidate();
        std::cerr << "[auth] session lookup failed: connection lost" << std::endl;
        return VerifyError::Unavailable;
    }
    if (r.is_error()) {
        std::cerr << "[auth] session lookup failed: " << r.error_text() << std::endl;
        return VerifyError::Unavailable;
    }
    if (r->type != REDIS_REPLY_STRING) return VerifyError::Rejected; // nil: unknown or expired

    auto user = parse_session(std::string(r->str, r->len));
    if (!user) {
        std::cerr << "[auth] malformed session document" << std::endl;
        return VerifyError::Malformed;
    }
    return Principal{*user};
}
