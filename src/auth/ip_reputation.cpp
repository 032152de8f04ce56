#include "auth/ip_reputation.hpp"
#include <functional>

namespace voxgate::auth {

IPReputationTracker::IPReputationTracker(audit::SecurityEventLog& events,
                                         ReputationPolicy policy, core::NowFn now)
    : events_(events), policy_(policy), now_(std::move(now)) {}

IPReputationTracker::Shard& IPReputationTracker::shard_for(const std::string& ip) {
    return shards_[std::hash<std::string>{}(ip) % SHARD_COUNT];
}

void IPReputationTracker::sweep(Shard& shard, core::TimePoint window_start) {
    for (auto it = shard.failures.begin(); it != shard.failures.end(); ) {
        auto& history = it->second;
        while (!history.empty() && history.front() <= window_start) {
            history.pop_front();
        }
        if (history.empty()) {
            it = shard.failures.erase(it);
        } else {
            ++it;
        }
    }
    shard.inserts_since_sweep = 0;
}

bool IPReputationTracker::track_failure(const std::string& ip) {
    const auto now = now_();
    const auto window_start = now - policy_.failure_window;

    size_t failure_count = 0;
    std::optional<std::chrono::minutes> block_for;
    core::TimePoint block_until;
    {
        Shard& shard = shard_for(ip);
        std::lock_guard<std::mutex> lock(shard.mutex);

        if (shard.failures.find(ip) == shard.failures.end() &&
            ++shard.inserts_since_sweep >= SWEEP_INTERVAL) {
            sweep(shard, window_start);
        }

        auto& history = shard.failures[ip];
        history.push_back(now);
        while (!history.empty() && history.front() <= window_start) {
            history.pop_front();
        }
        failure_count = history.size();

        if (failure_count >= policy_.hard_threshold) {
            block_for = policy_.hard_block;
        } else if (failure_count >= policy_.soft_threshold) {
            block_for = policy_.soft_block;
        }

        if (block_for) {
            block_until = now + *block_for;
            shard.blocks[ip] = block_until;
        }
    }

    if (!block_for) {
        return false;
    }

    events_.record(audit::events::IP_BLOCKED, ip, {
        {"ip", ip},
        {"failures", failure_count},
        {"duration_minutes", block_for->count()},
        {"block_until", core::to_epoch_seconds(block_until)}
    });
    return true;
}

bool IPReputationTracker::is_blocked(const std::string& ip) {
    return blocked_until(ip).has_value();
}

std::optional<core::TimePoint> IPReputationTracker::blocked_until(const std::string& ip) {
    const auto now = now_();
    Shard& shard = shard_for(ip);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.blocks.find(ip);
    if (it == shard.blocks.end()) {
        return std::nullopt;
    }
    if (now < it->second) {
        return it->second;
    }
    shard.blocks.erase(it);
    return std::nullopt;
}

size_t IPReputationTracker::blocked_count() {
    const auto now = now_();
    size_t total = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto it = shard.blocks.begin(); it != shard.blocks.end(); ) {
            if (now < it->second) {
                total++;
                ++it;
            } else {
                it = shard.blocks.erase(it);
            }
        }
    }
    return total;
}

std::map<std::string, size_t> IPReputationTracker::failure_counts() {
    const auto window_start = now_() - policy_.failure_window;
    std::map<std::string, size_t> counts;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        sweep(shard, window_start);
        for (const auto& [ip, history] : shard.failures) {
            counts[ip] = history.size();
        }
    }
    return counts;
}

size_t IPReputationTracker::tracked_count() {
    const auto window_start = now_() - policy_.failure_window;
    size_t total = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        sweep(shard, window_start);
        total += shard.failures.size();
    }
    return total;
}

} // namespace voxgate::auth
