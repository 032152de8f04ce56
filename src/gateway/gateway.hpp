#pragma once
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "gateway/context.hpp"
#include "gateway/module.hpp"
#include "gateway/op_router.hpp"
#include "gateway/request_stage.hpp"

namespace voxgate::gateway {

// Request entry point. Runs the auth chain (IP reputation, credential, rate
// limit, tier permission) and dispatches to the op handlers. Never throws:
// every failure becomes {"success": false, "error": {...}}.
class Gateway {
public:
    explicit Gateway(GatewayContext& context);

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    nlohmann::json handle(const Request& request);

    // Parses then handles one raw request line.
    nlohmann::json handle_json(const nlohmann::json& raw);

    const OpRouter& router() const { return router_; }
    GatewayContext& context() { return context_; }

private:
    void reject_if_blocked(const Request& request);
    Caller authenticate(const Request& request);
    void check_rate(const Caller& caller, nlohmann::json& response);
    void check_permission(const Caller& caller, const std::string& op, const OpPolicy& policy);

    GatewayContext& context_;
    OpRouter router_;
    std::vector<std::unique_ptr<GatewayModule>> modules_;
};

} // namespace voxgate::gateway
