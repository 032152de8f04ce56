#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "audit/security_events.hpp"
#include "core/clock.hpp"

namespace voxgate::auth {

struct SessionClaims {
    std::string subject;
    std::string tier;
    std::vector<std::string> permissions;
    int64_t issued_at = 0;  // epoch seconds
    int64_t expiry = 0;     // epoch seconds

    nlohmann::json to_json() const;
};

enum class TokenStatus {
    VALID,
    EXPIRED_SIGNATURE,  // signature good, expiry passed: re-authenticate
    INVALID_SIGNATURE   // tampered or malformed: treat as hostile
};

const char* token_status_to_string(TokenStatus status);

struct TokenValidation {
    TokenStatus status = TokenStatus::INVALID_SIGNATURE;
    SessionClaims claims;
    std::string error;

    bool valid() const { return status == TokenStatus::VALID; }
};

// Stateless HS256 session tokens (compact JWT form).
class SessionTokenIssuer {
public:
    static constexpr std::chrono::hours DEFAULT_TTL{24};

    SessionTokenIssuer(std::vector<uint8_t> secret, audit::SecurityEventLog& events,
                       std::chrono::seconds ttl = DEFAULT_TTL,
                       core::NowFn now = core::system_now());

    std::string issue(const std::string& subject, const std::string& tier,
                      const std::vector<std::string>& permissions,
                      const std::string& source = "") const;

    TokenValidation validate(const std::string& token, const std::string& source = "") const;

    std::chrono::seconds ttl() const { return ttl_; }

    // Three non-empty dot-separated segments.
    static bool looks_like_token(const std::string& credential);

private:
    std::string sign(const std::string& signing_input) const;

    std::vector<uint8_t> secret_;
    audit::SecurityEventLog& events_;
    std::chrono::seconds ttl_;
    core::NowFn now_;
};

} // namespace voxgate::auth
