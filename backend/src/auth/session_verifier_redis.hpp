#pragma once
#include <memory>
#include <optional>
#include <string>

#include "auth/credential_verifier.hpp"
#include "redis/redis_pool.hpp"

// Looks the token up as "session:<token>", a JSON document written at login
// with at least {"user_id": <int>}. Expiry is the key's Redis TTL.
class RedisSessionVerifier final : public ICredentialVerifier {
public:
    explicit RedisSessionVerifier(std::shared_ptr<RedisPool> pool);

    VerifyResult verify(const std::string& token) override;

    // user_id from a stored session document, if well-formed.
    static std::optional<UserId> parse_session(const std::string& doc);

private:
    std::shared_ptr<RedisPool> pool_;
};
