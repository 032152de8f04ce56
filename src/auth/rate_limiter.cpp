#include "auth/rate_limiter.hpp"
#include <functional>

namespace voxgate::auth {

nlohmann::json RateLimitDecision::to_json() const {
    nlohmann::json j{
        {"allowed", allowed},
        {"current_count", count},
        {"limit", limit},
        {"remaining", remaining},
        {"window_seconds", window_seconds},
        {"reset_time", reset_time}
    };
    if (!allowed) {
        j["retry_after"] = retry_after;
    }
    return j;
}

RateLimiter::RateLimiter(audit::SecurityEventLog& events,
                         std::unordered_map<std::string, RateProfile> profile_overrides,
                         core::NowFn now)
    : events_(events), overrides_(std::move(profile_overrides)), now_(std::move(now)) {}

RateProfile RateLimiter::profile_for(const std::string& tier) const {
    auto it = overrides_.find(tier);
    if (it != overrides_.end()) {
        return it->second;
    }
    return tier_rate_profile(tier);
}

RateLimiter::Shard& RateLimiter::shard_for(const std::string& client_id) {
    return shards_[std::hash<std::string>{}(client_id) % SHARD_COUNT];
}

RateLimitDecision RateLimiter::check(const std::string& client_id, const std::string& tier,
                                     const std::string& source) {
    const RateProfile profile = profile_for(tier);
    const auto now = now_();
    const auto window_start = now - profile.window;

    RateLimitDecision decision;
    decision.limit = profile.limit;
    decision.window_seconds = static_cast<long>(profile.window.count());

    {
        Shard& shard = shard_for(client_id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto& client = shard.windows[client_id];
        client.window = profile.window;
        auto& requests = client.requests;

        // Edge is exclusive: a timestamp exactly window_seconds old is gone.
        while (!requests.empty() && requests.front() <= window_start) {
            requests.pop_front();
        }

        const size_t current = requests.size();
        if (current >= profile.limit) {
            const auto oldest = requests.empty() ? now : requests.front();
            const auto reset = oldest + profile.window;
            decision.allowed = false;
            decision.count = current;
            decision.remaining = 0;
            decision.reset_time = core::to_epoch_seconds(reset);
            decision.retry_after = std::chrono::duration<double>(reset - now).count();
        } else {
            requests.push_back(now);
            decision.allowed = true;
            decision.count = current + 1;
            decision.remaining = profile.limit - decision.count;
            decision.reset_time = core::to_epoch_seconds(requests.front() + profile.window);
        }
    }

    if (!decision.allowed) {
        events_.record(audit::events::RATE_LIMIT_EXCEEDED, source, {
            {"client_id", client_id},
            {"key_type", tier},
            {"count", decision.count},
            {"limit", decision.limit},
            {"retry_after", decision.retry_after}
        });
    }
    return decision;
}

size_t RateLimiter::bucket_count() const {
    const auto now = now_();
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& [_, client] : shard.windows) {
            if (!client.requests.empty() && client.requests.back() > now - client.window) {
                total++;
            }
        }
    }
    return total;
}

} // namespace voxgate::auth
