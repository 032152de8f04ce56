#pragma once
#include <memory>
#include <vector>
#include "audit/security_events.hpp"
#include "auth/credentials.hpp"
#include "auth/ip_reputation.hpp"
#include "auth/rate_limiter.hpp"
#include "auth/session_tokens.hpp"
#include "core/clock.hpp"
#include "gateway/config.hpp"
#include "sandbox/command_validator.hpp"
#include "sandbox/executor.hpp"
#include "skills/intent_router.hpp"
#include "skills/permission_store.hpp"
#include "skills/registry.hpp"

namespace voxgate::gateway {

// Every long-lived component of one gateway process. Members are declared
// in dependency order; later members hold references to earlier ones.
struct GatewayContext {
    GatewayContext(GatewayConfig config, auth::CredentialTable credentials,
                   core::NowFn now = core::system_now());

    // Non-copyable, non-movable: components reference each other
    GatewayContext(const GatewayContext&) = delete;
    GatewayContext& operator=(const GatewayContext&) = delete;

    GatewayConfig config;
    audit::SecurityEventLog events;

    auth::CredentialTable credentials;
    auth::CredentialValidator credential_validator;
    auth::RateLimiter rate_limiter;
    auth::IPReputationTracker ip_reputation;
    auth::SessionTokenIssuer tokens;

    sandbox::CommandValidator command_validator;
    sandbox::SkillSandboxExecutor executor;

    skills::PermissionStore permissions;
    std::vector<skills::SkillManifest> manifests;
    skills::IntentRouter router;
};

} // namespace voxgate::gateway
