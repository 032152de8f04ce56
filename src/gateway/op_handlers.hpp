#pragma once
#include <nlohmann/json.hpp>
#include "gateway/context.hpp"
#include "gateway/module.hpp"
#include "gateway/op_router.hpp"

namespace voxgate::gateway {

// Session token issue and verification
class AuthOps : public GatewayModule {
public:
    explicit AuthOps(GatewayContext& context) : context_(context) {}
    void register_ops(OpRouter& router) override;

private:
    nlohmann::json handle_token(const OpCall& call);
    nlohmann::json handle_verify(const OpCall& call);

    GatewayContext& context_;
};

// Intent routing, plans, direct skill calls and the skill catalogue
class SkillOps : public GatewayModule {
public:
    explicit SkillOps(GatewayContext& context) : context_(context) {}
    void register_ops(OpRouter& router) override;

private:
    nlohmann::json handle_route(const OpCall& call);
    nlohmann::json handle_plan(const OpCall& call);
    nlohmann::json handle_run(const OpCall& call);
    nlohmann::json handle_list(const OpCall& call);

    GatewayContext& context_;
};

// Skill permission grants
class PermissionOps : public GatewayModule {
public:
    explicit PermissionOps(GatewayContext& context) : context_(context) {}
    void register_ops(OpRouter& router) override;

private:
    nlohmann::json handle_request(const OpCall& call);
    nlohmann::json handle_grant(const OpCall& call);
    nlohmann::json handle_revoke(const OpCall& call);

    GatewayContext& context_;
};

// Security audit queries
class AuditOps : public GatewayModule {
public:
    explicit AuditOps(GatewayContext& context) : context_(context) {}
    void register_ops(OpRouter& router) override;

private:
    nlohmann::json handle_stats(const OpCall& call);
    nlohmann::json handle_events(const OpCall& call);

    GatewayContext& context_;
};

// Required string field of the request body. Throws core::InvalidRequest.
std::string require_string(const nlohmann::json& body, const char* field);

} // namespace voxgate::gateway
