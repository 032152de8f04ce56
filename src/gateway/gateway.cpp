#include "gateway/gateway.hpp"
#include "gateway/op_handlers.hpp"
#include "auth/tiers.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace voxgate::gateway {

Gateway::Gateway(GatewayContext& context)
    : context_(context) {
    modules_.push_back(std::make_unique<AuthOps>(context_));
    modules_.push_back(std::make_unique<SkillOps>(context_));
    modules_.push_back(std::make_unique<PermissionOps>(context_));
    modules_.push_back(std::make_unique<AuditOps>(context_));

    for (auto& module : modules_) {
        module->register_ops(router_);
    }
    spdlog::debug("Gateway registered {} ops", router_.ops().size());
}

json Gateway::handle_json(const json& raw) {
    try {
        return handle(Request::from_json(raw));
    } catch (const core::GatewayError& e) {
        std::string source = raw.is_object() && raw.contains("source_ip") && raw["source_ip"].is_string()
                                 ? raw["source_ip"].get<std::string>() : "";
        context_.events.record(audit::events::REQUEST_REJECTED, source, {{"reason", e.what()}});

        json response;
        response["success"] = false;
        response["stage"] = request_stage_to_string(RequestStage::FAILED);
        response["error"] = e.to_json();
        return response;
    }
}

json Gateway::handle(const Request& request) {
    RequestStage stage = RequestStage::UNVALIDATED;
    json response;
    response["op"] = request.op;

    try {
        const auto* route = router_.find(request.op);
        if (!route) {
            throw core::InvalidRequest("unknown op '" + request.op + "'");
        }

        Caller caller;
        caller.source_ip = request.source_ip;

        if (route->policy.requires_auth) {
            caller = authenticate(request);
            check_rate(caller, response);
            stage = RequestStage::RATE_CHECKED;
            check_permission(caller, request.op, route->policy);
        } else {
            reject_if_blocked(request);
        }
        stage = RequestStage::PERMISSION_CHECKED;

        stage = RequestStage::EXECUTING;
        json result = route->handler(OpCall{request, caller});
        if (result.is_object()) {
            for (auto& [key, value] : result.items()) {
                response[key] = value;
            }
        } else {
            response["result"] = result;
        }

        stage = RequestStage::COMPLETED;
        response["success"] = true;

    } catch (const core::SandboxTimeout& e) {
        stage = RequestStage::TIMEOUT;
        response["success"] = false;
        response["error"] = e.to_json();

    } catch (const core::GatewayError& e) {
        if (stage != RequestStage::EXECUTING) {
            context_.events.record(audit::events::REQUEST_REJECTED, request.source_ip,
                                   {{"op", request.op},
                                    {"code", core::error_code_to_string(e.code())},
                                    {"stage", request_stage_to_string(stage)}});
        }
        stage = RequestStage::FAILED;
        response["success"] = false;
        response["error"] = e.to_json();

    } catch (const json::exception& e) {
        stage = RequestStage::FAILED;
        response["success"] = false;
        response["error"] = core::InvalidRequest(std::string("malformed body: ") + e.what()).to_json();

    } catch (const std::exception& e) {
        spdlog::error("Op {} failed: {}", request.op, e.what());
        stage = RequestStage::FAILED;
        response["success"] = false;
        response["error"] = core::GatewayError(core::ErrorCode::INTERNAL, e.what()).to_json();
    }

    response["stage"] = request_stage_to_string(stage);
    return response;
}

void Gateway::reject_if_blocked(const Request& request) {
    const std::string& ip = request.source_ip;
    if (ip.empty()) return;

    auto until = context_.ip_reputation.blocked_until(ip);
    if (until) {
        context_.events.record(audit::events::BLOCKED_IP_REJECTED, ip, {{"op", request.op}});
        throw core::IPBlocked(ip, core::to_epoch_seconds(*until));
    }
}

Caller Gateway::authenticate(const Request& request) {
    const std::string& ip = request.source_ip;
    reject_if_blocked(request);

    auto fail = [&](const std::string& message) -> core::AuthenticationError {
        if (!ip.empty()) {
            context_.ip_reputation.track_failure(ip);
        }
        return core::AuthenticationError(message);
    };

    if (request.credential.empty()) {
        throw fail("missing credential");
    }

    Caller caller;
    caller.authenticated = true;
    caller.source_ip = ip;

    if (auth::SessionTokenIssuer::looks_like_token(request.credential)) {
        auto validation = context_.tokens.validate(request.credential, ip);
        if (validation.status == auth::TokenStatus::EXPIRED_SIGNATURE) {
            throw fail("session token expired");
        }
        if (!validation.valid()) {
            throw fail("invalid session token");
        }
        caller.client_id = validation.claims.subject;
        caller.tier = validation.claims.tier;
        caller.permissions = validation.claims.permissions;
        return caller;
    }

    auto check = context_.credential_validator.validate(request.credential, ip);
    if (!check.valid) {
        throw fail("invalid API key");
    }
    caller.client_id = check.key_name;
    caller.tier = check.tier;
    caller.permissions = check.permissions;
    return caller;
}

void Gateway::check_rate(const Caller& caller, json& response) {
    auto decision = context_.rate_limiter.check(caller.client_id, caller.tier, caller.source_ip);
    response["rate_limit"] = {
        {"limit", decision.limit},
        {"remaining", decision.remaining},
        {"reset", decision.reset_time}
    };
    if (!decision.allowed) {
        throw core::RateLimitExceeded(decision.retry_after, decision.to_json());
    }
}

void Gateway::check_permission(const Caller& caller, const std::string& op, const OpPolicy& policy) {
    if (policy.permission.empty() || auth::has_permission(caller.permissions, policy.permission)) {
        return;
    }
    context_.events.record(audit::events::PERMISSION_DENIED, caller.source_ip,
                           {{"op", op}, {"client", caller.client_id},
                            {"tier", caller.tier}, {"permission", policy.permission}});
    throw core::PermissionDenied(policy.permission);
}

} // namespace voxgate::gateway
