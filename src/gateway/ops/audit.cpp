#include "gateway/op_handlers.hpp"
#include "core/errors.hpp"

using json = nlohmann::json;

namespace voxgate::gateway {

void AuditOps::register_ops(OpRouter& router) {
    router.register_op("audit.stats", {true, "admin"},
        [this](const OpCall& call) { return handle_stats(call); });
    router.register_op("audit.events", {true, "admin"},
        [this](const OpCall& call) { return handle_events(call); });
}

json AuditOps::handle_stats(const OpCall& /*call*/) {
    auto stats = context_.events.stats();

    json response;
    response["total_events"] = stats.total_events;
    response["recent_events"] = stats.recent_events;
    response["event_types"] = stats.event_types;
    response["blocked_ips"] = context_.ip_reputation.blocked_count();
    response["active_rate_limit_buckets"] = context_.rate_limiter.bucket_count();
    response["failed_attempts"] = context_.ip_reputation.failure_counts();
    response["credentials"] = context_.credential_validator.credential_count();
    return response;
}

json AuditOps::handle_events(const OpCall& call) {
    const auto& request = call.request.body;

    std::string type = request.value("type", "");
    long limit = request.value("limit", 100L);
    if (limit <= 0) {
        throw core::InvalidRequest("limit must be positive");
    }

    auto entries = context_.events.entries(type, static_cast<size_t>(limit));

    json response;
    response["count"] = entries.size();
    response["events"] = json::array();
    for (const auto& entry : entries) {
        response["events"].push_back(entry.to_json());
    }
    return response;
}

} // namespace voxgate::gateway
