#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace voxgate::gateway {

// One request as it arrives from a client.
struct Request {
    std::string op;
    std::string credential;   // API key or session token
    std::string source_ip;
    nlohmann::json body = nlohmann::json::object();

    // Missing fields become empty values. Throws core::InvalidRequest on a
    // non-object request or a field with the wrong type.
    static Request from_json(const nlohmann::json& j);
};

// Identity established by the auth chain.
struct Caller {
    bool authenticated = false;
    std::string client_id;    // credential key name or token subject
    std::string tier;
    std::vector<std::string> permissions;
    std::string source_ip;

    // Context handed to skills: {"source", "client", "tier"}
    nlohmann::json skill_context() const;
};

struct OpCall {
    const Request& request;
    const Caller& caller;
};

// Access requirements of an op.
struct OpPolicy {
    bool requires_auth = true;
    std::string permission;   // tier permission; empty = any authenticated caller
};

// Centralized op dispatch table.
class OpRouter {
public:
    // Returns the op-specific response fields. Throws core::GatewayError.
    using Handler = std::function<nlohmann::json(const OpCall&)>;

    struct Route {
        OpPolicy policy;
        Handler handler;
    };

    OpRouter() = default;

    void register_op(const std::string& op, OpPolicy policy, Handler handler);
    const Route* find(const std::string& op) const;
    std::vector<std::string> ops() const;

private:
    std::unordered_map<std::string, Route> routes_;
};

} // namespace voxgate::gateway
