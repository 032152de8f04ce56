#include "audit/security_events.hpp"
#include <spdlog/spdlog.h>

namespace voxgate::audit {

nlohmann::json SecurityEvent::to_json() const {
    return nlohmann::json{
        {"id", id},
        {"timestamp", core::to_epoch_millis(timestamp)},
        {"event_type", event_type},
        {"ip_address", source},
        {"details", details}
    };
}

SecurityEventLog::SecurityEventLog(size_t max_entries, core::NowFn now)
    : max_entries_(max_entries == 0 ? 1 : max_entries), now_(std::move(now)) {}

void SecurityEventLog::record(const std::string& event_type, const std::string& source,
                              const nlohmann::json& details) {
    SecurityEvent event;
    event.timestamp = now_();
    event.event_type = event_type;
    event.source = source.empty() ? "local" : source;
    event.details = details;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        event.id = next_id_++;
        events_.push_back(event);
        while (events_.size() > max_entries_) {
            events_.pop_front();
        }
    }

    spdlog::info("Security event: {} from {} - {}", event.event_type, event.source, details.dump());
}

std::vector<SecurityEvent> SecurityEventLog::entries(const std::string& event_type, size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SecurityEvent> result;
    for (auto it = events_.rbegin(); it != events_.rend() && result.size() < limit; ++it) {
        if (event_type.empty() || it->event_type == event_type) {
            result.push_back(*it);
        }
    }
    return std::vector<SecurityEvent>(result.rbegin(), result.rend());
}

SecurityStats SecurityEventLog::stats() const {
    const auto hour_ago = now_() - std::chrono::hours(1);

    std::lock_guard<std::mutex> lock(mutex_);
    SecurityStats stats;
    stats.total_events = events_.size();
    for (const auto& event : events_) {
        if (event.timestamp > hour_ago) {
            stats.recent_events++;
            stats.event_types[event.event_type]++;
        }
    }
    return stats;
}

size_t SecurityEventLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

} // namespace voxgate::audit
