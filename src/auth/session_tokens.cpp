#include "auth/session_tokens.hpp"
#include "core/crypto.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace voxgate::auth {

namespace {

int64_t epoch_seconds(core::TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::vector<std::string> split_token(const std::string& token) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = token.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(token.substr(start));
            break;
        }
        parts.push_back(token.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

std::string token_prefix(const std::string& token) {
    return token.substr(0, 20) + "...";
}

} // namespace

json SessionClaims::to_json() const {
    return json{
        {"sub", subject},
        {"key_type", tier},
        {"permissions", permissions},
        {"iat", issued_at},
        {"exp", expiry}
    };
}

const char* token_status_to_string(TokenStatus status) {
    switch (status) {
        case TokenStatus::VALID:             return "valid";
        case TokenStatus::EXPIRED_SIGNATURE: return "ExpiredSignature";
        case TokenStatus::INVALID_SIGNATURE: return "InvalidSignature";
        default: return "unknown";
    }
}

SessionTokenIssuer::SessionTokenIssuer(std::vector<uint8_t> secret, audit::SecurityEventLog& events,
                                       std::chrono::seconds ttl, core::NowFn now)
    : secret_(std::move(secret)), events_(events), ttl_(ttl), now_(std::move(now)) {
    if (secret_.empty()) {
        throw std::invalid_argument("session token secret must not be empty");
    }
}

bool SessionTokenIssuer::looks_like_token(const std::string& credential) {
    auto parts = split_token(credential);
    if (parts.size() != 3) return false;
    for (const auto& p : parts) {
        if (p.empty()) return false;
    }
    return true;
}

std::string SessionTokenIssuer::sign(const std::string& signing_input) const {
    return core::crypto::base64url_encode(core::crypto::hmac_sha256(secret_, signing_input));
}

std::string SessionTokenIssuer::issue(const std::string& subject, const std::string& tier,
                                      const std::vector<std::string>& permissions,
                                      const std::string& source) const {
    SessionClaims claims;
    claims.subject = subject;
    claims.tier = tier;
    claims.permissions = permissions;
    claims.issued_at = epoch_seconds(now_());
    claims.expiry = claims.issued_at + ttl_.count();

    static const std::string header = core::crypto::base64url_encode(
        json{{"alg", "HS256"}, {"typ", "JWT"}}.dump());
    const std::string signing_input = header + "." + core::crypto::base64url_encode(claims.to_json().dump());
    const std::string token = signing_input + "." + sign(signing_input);

    events_.record(audit::events::TOKEN_ISSUED, source, {
        {"user_id", subject},
        {"key_type", tier},
        {"expires", claims.expiry}
    });
    return token;
}

TokenValidation SessionTokenIssuer::validate(const std::string& token, const std::string& source) const {
    TokenValidation result;

    auto reject = [&](const std::string& error) {
        result.status = TokenStatus::INVALID_SIGNATURE;
        result.error = error;
        events_.record(audit::events::TOKEN_INVALID, source,
                       {{"error", error}, {"token", token_prefix(token)}});
        return result;
    };

    auto parts = split_token(token);
    if (parts.size() != 3) {
        return reject("malformed token");
    }

    // Nothing inside the token is trusted before the signature checks out.
    const std::string signing_input = parts[0] + "." + parts[1];
    if (!core::crypto::constant_time_equals(sign(signing_input), parts[2])) {
        return reject("signature verification failed");
    }

    auto header_text = core::crypto::base64url_decode(parts[0]);
    auto claims_text = core::crypto::base64url_decode(parts[1]);
    if (!header_text || !claims_text) {
        return reject("malformed token encoding");
    }

    json header = json::parse(*header_text, nullptr, false);
    json claims = json::parse(*claims_text, nullptr, false);
    if (header.is_discarded() || claims.is_discarded() || !claims.is_object()) {
        return reject("malformed token payload");
    }
    if (header.value("alg", "") != "HS256") {
        return reject("unsupported algorithm");
    }
    if (!claims.contains("exp") || !claims["exp"].is_number_integer()) {
        return reject("missing expiry");
    }

    result.claims.subject = claims.value("sub", "");
    result.claims.tier = claims.value("key_type", "");
    result.claims.issued_at = claims.value("iat", int64_t{0});
    result.claims.expiry = claims["exp"].get<int64_t>();
    if (claims.contains("permissions") && claims["permissions"].is_array()) {
        for (const auto& p : claims["permissions"]) {
            if (p.is_string()) {
                result.claims.permissions.push_back(p.get<std::string>());
            }
        }
    }

    if (epoch_seconds(now_()) >= result.claims.expiry) {
        result.status = TokenStatus::EXPIRED_SIGNATURE;
        result.error = "token expired";
        events_.record(audit::events::TOKEN_EXPIRED, source, {{"token", token_prefix(token)}});
        return result;
    }

    result.status = TokenStatus::VALID;
    events_.record(audit::events::TOKEN_VALIDATED, source, {
        {"user_id", result.claims.subject},
        {"key_type", result.claims.tier}
    });
    return result;
}

} // namespace voxgate::auth
