#include "gateway/op_handlers.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace voxgate::gateway {

void PermissionOps::register_ops(OpRouter& router) {
    router.register_op("permission.request", {true, "read"},
        [this](const OpCall& call) { return handle_request(call); });
    router.register_op("permission.grant", {true, "admin"},
        [this](const OpCall& call) { return handle_grant(call); });
    router.register_op("permission.revoke", {true, "admin"},
        [this](const OpCall& call) { return handle_revoke(call); });
}

json PermissionOps::handle_request(const OpCall& call) {
    std::string name = require_string(call.request.body, "permission");
    return context_.permissions.request_permission(name);
}

json PermissionOps::handle_grant(const OpCall& call) {
    std::string name = require_string(call.request.body, "permission");
    auto response = context_.permissions.grant_permission(name);
    spdlog::info("{} granted permission {}", call.caller.client_id, name);
    return response;
}

json PermissionOps::handle_revoke(const OpCall& call) {
    std::string name = require_string(call.request.body, "permission");
    context_.permissions.revoke(name);
    spdlog::info("{} revoked permission {}", call.caller.client_id, name);

    json response;
    response["permission"] = name;
    response["granted"] = false;
    return response;
}

} // namespace voxgate::gateway
