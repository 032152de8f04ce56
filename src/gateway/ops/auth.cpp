#include "gateway/op_handlers.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace voxgate::gateway {

void AuthOps::register_ops(OpRouter& router) {
    router.register_op("auth.token", {true, "read"},
        [this](const OpCall& call) { return handle_token(call); });
    router.register_op("auth.verify", {false, ""},
        [this](const OpCall& call) { return handle_verify(call); });
}

json AuthOps::handle_token(const OpCall& call) {
    const auto& caller = call.caller;
    std::string token = context_.tokens.issue(caller.client_id, caller.tier,
                                              caller.permissions, caller.source_ip);
    spdlog::info("Issued session token for {} ({})", caller.client_id, caller.tier);

    json response;
    response["token"] = token;
    response["token_type"] = "Bearer";
    response["expires_in"] = context_.tokens.ttl().count();
    response["tier"] = caller.tier;
    response["permissions"] = caller.permissions;
    return response;
}

json AuthOps::handle_verify(const OpCall& call) {
    std::string token = require_string(call.request.body, "token");
    auto validation = context_.tokens.validate(token, call.request.source_ip);

    json response;
    response["valid"] = validation.valid();
    response["status"] = auth::token_status_to_string(validation.status);
    if (validation.valid()) {
        response["claims"] = validation.claims.to_json();
    } else {
        response["reason"] = validation.error;
    }
    return response;
}

std::string require_string(const json& body, const char* field) {
    if (!body.is_object() || !body.contains(field) || !body[field].is_string()) {
        throw core::InvalidRequest(std::string("body field '") + field + "' must be a string");
    }
    std::string value = body[field].get<std::string>();
    if (value.empty()) {
        throw core::InvalidRequest(std::string("body field '") + field + "' is empty");
    }
    return value;
}

} // namespace voxgate::gateway
