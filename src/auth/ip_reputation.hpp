#pragma once
#include <array>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "audit/security_events.hpp"
#include "core/clock.hpp"

namespace voxgate::auth {

struct ReputationPolicy {
    std::chrono::seconds failure_window{3600};
    size_t soft_threshold = 5;
    std::chrono::minutes soft_block{15};
    size_t hard_threshold = 10;
    std::chrono::minutes hard_block{30};
};

// Failed-attempt history and temporary blocks per source address. Blocks
// expire lazily: an expired entry is removed by the lookup that finds it.
class IPReputationTracker {
public:
    static constexpr size_t SHARD_COUNT = 16;

    explicit IPReputationTracker(audit::SecurityEventLog& events,
                                 ReputationPolicy policy = {},
                                 core::NowFn now = core::system_now());

    // Records a failure. Returns true if the address is now blocked.
    bool track_failure(const std::string& ip);

    bool is_blocked(const std::string& ip);

    // Block expiry for a currently blocked address.
    std::optional<core::TimePoint> blocked_until(const std::string& ip);

    size_t blocked_count();

    // Failures inside the window, per address.
    std::map<std::string, size_t> failure_counts();

    // Addresses with failure history still held in memory.
    size_t tracked_count();

    const ReputationPolicy& policy() const { return policy_; }

private:
    struct Shard {
        std::mutex mutex;
        std::unordered_map<std::string, std::deque<core::TimePoint>> failures;
        std::unordered_map<std::string, core::TimePoint> blocks;
        size_t inserts_since_sweep = 0;
    };

    // Sweeps are amortized over new addresses so the map stays bounded by
    // the addresses seen inside the window.
    static constexpr size_t SWEEP_INTERVAL = 256;

    Shard& shard_for(const std::string& ip);

    // Drops timestamps at or before window_start and erases emptied histories.
    // Caller holds the shard mutex.
    static void sweep(Shard& shard, core::TimePoint window_start);

    audit::SecurityEventLog& events_;
    ReputationPolicy policy_;
    core::NowFn now_;
    std::array<Shard, SHARD_COUNT> shards_;
};

} // namespace voxgate::auth
