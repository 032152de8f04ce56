#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/clock.hpp"

namespace voxgate::audit {

// Event type names recorded by the security layer
namespace events {
constexpr const char* INVALID_KEY_FORMAT   = "invalid_key_format";
constexpr const char* BLACKLISTED_KEY      = "blacklisted_key_pattern";
constexpr const char* VALID_API_KEY        = "valid_api_key";
constexpr const char* INVALID_API_KEY      = "invalid_api_key";
constexpr const char* RATE_LIMIT_EXCEEDED  = "rate_limit_exceeded";
constexpr const char* IP_BLOCKED           = "ip_blocked";
constexpr const char* BLOCKED_IP_REJECTED  = "blocked_ip_rejected";
constexpr const char* TOKEN_ISSUED         = "jwt_generated";
constexpr const char* TOKEN_VALIDATED      = "jwt_validated";
constexpr const char* TOKEN_EXPIRED        = "jwt_expired";
constexpr const char* TOKEN_INVALID        = "jwt_invalid";
constexpr const char* PERMISSION_DENIED    = "permission_denied";
constexpr const char* PERMISSION_GRANTED   = "permission_granted";
constexpr const char* PERMISSION_REVOKED   = "permission_revoked";
constexpr const char* SECURITY_VIOLATION   = "security_violation";
constexpr const char* SANDBOX_TIMEOUT      = "sandbox_timeout";
constexpr const char* SANDBOX_ERROR        = "sandbox_error";
constexpr const char* SKILL_EXECUTED       = "skill_executed";
constexpr const char* SKILL_NOT_FOUND      = "skill_not_found";
constexpr const char* REQUEST_REJECTED     = "request_rejected";
} // namespace events

struct SecurityEvent {
    uint64_t id = 0;
    core::TimePoint timestamp;
    std::string event_type;
    std::string source;  // source address, "local" when not request-bound
    nlohmann::json details;

    nlohmann::json to_json() const;
};

struct SecurityStats {
    size_t total_events = 0;
    size_t recent_events = 0;                  // within the last hour
    std::map<std::string, size_t> event_types; // recent events by type
};

// Bounded in-memory audit trail. Oldest events are dropped once max_entries
// is reached.
class SecurityEventLog {
public:
    explicit SecurityEventLog(size_t max_entries = 1000, core::NowFn now = core::system_now());

    void record(const std::string& event_type, const std::string& source,
                const nlohmann::json& details = nlohmann::json::object());

    // Most recent events, oldest first. Empty type means all types.
    std::vector<SecurityEvent> entries(const std::string& event_type = "", size_t limit = 100) const;

    SecurityStats stats() const;

    size_t size() const;
    size_t max_entries() const { return max_entries_; }

private:
    size_t max_entries_;
    core::NowFn now_;
    std::deque<SecurityEvent> events_;
    uint64_t next_id_ = 1;
    mutable std::mutex mutex_;
};

} // namespace voxgate::audit
