#pragma once
#include <array>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "auth/tiers.hpp"
#include "audit/security_events.hpp"
#include "core/clock.hpp"

namespace voxgate::auth {

struct RateLimitDecision {
    bool allowed = false;
    size_t count = 0;          // requests in the window, including this one when allowed
    size_t limit = 0;
    size_t remaining = 0;
    long window_seconds = 0;
    double reset_time = 0.0;   // epoch seconds when the oldest request leaves the window
    double retry_after = 0.0;  // seconds; zero when allowed

    nlohmann::json to_json() const;
};

// Sliding-window limiter keyed by client identity. State is split into
// shards by hash of the client id; each shard has its own mutex and the
// prune/count/append sequence for one client runs under it.
class RateLimiter {
public:
    static constexpr size_t SHARD_COUNT = 16;

    explicit RateLimiter(audit::SecurityEventLog& events,
                         std::unordered_map<std::string, RateProfile> profile_overrides = {},
                         core::NowFn now = core::system_now());

    RateLimitDecision check(const std::string& client_id, const std::string& tier,
                            const std::string& source = "");

    RateProfile profile_for(const std::string& tier) const;

    // Clients with at least one request inside their window.
    size_t bucket_count() const;

private:
    struct ClientWindow {
        std::deque<core::TimePoint> requests;
        std::chrono::seconds window{0};
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, ClientWindow> windows;
    };

    Shard& shard_for(const std::string& client_id);

    audit::SecurityEventLog& events_;
    std::unordered_map<std::string, RateProfile> overrides_;
    core::NowFn now_;
    std::array<Shard, SHARD_COUNT> shards_;
};

} // namespace voxgate::auth
