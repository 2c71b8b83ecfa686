#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>

#include "stream/stream_types.hpp"

enum class VerifyError {
    Rejected,    // unknown or expired credential
    Malformed,   // the stored session names no user
    Unavailable  // the credential store could not be asked
};

inline const char* to_cstr(VerifyError e) {
    switch (e) {
        case VerifyError::Rejected: return "rejected";
        case VerifyError::Malformed: return "malformed";
        case VerifyError::Unavailable: return "unavailable";
    }
    return "?";
}

using VerifyResult = std::variant<Principal, VerifyError>;

class ICredentialVerifier {
public:
    virtual ~ICredentialVerifier() = default;
    virtual VerifyResult verify(const std::string& token) = 0;
};

// Fixed token table; set_available(false) makes every call Unavailable.
class StaticVerifier final : public ICredentialVerifier {
public:
    void add(std::string token, UserId user) { tokens_[std::move(token)] = user; }
    void add_malformed(std::string token) { malformed_.insert(std::move(token)); }
    void set_available(bool on) { available_ = on; }

    VerifyResult verify(const std::string& token) override {
        if (!available_) return VerifyError::Unavailable;
        if (malformed_.count(token)) return VerifyError::Malformed;
        auto it = tokens_.find(token);
        if (it == tokens_.end()) return VerifyError::Rejected;
        return Principal{it->second};
    }

private:
    std::unordered_map<std::string, UserId> tokens_;
    std::unordered_set<std::string> malformed_;
    bool available_{true};
};
