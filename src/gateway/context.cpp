#include "gateway/context.hpp"
#include "core/crypto.hpp"
#include "skills/builtin_skills.hpp"
#include <spdlog/spdlog.h>

namespace voxgate::gateway {

namespace {

std::vector<uint8_t> token_secret_from(const std::string& configured) {
    if (configured.empty()) {
        spdlog::info("No token secret configured, using a random per-process secret");
        return core::crypto::random_bytes(32);
    }
    return std::vector<uint8_t>(configured.begin(), configured.end());
}

sandbox::SandboxOptions sandbox_options_from(const GatewayConfig& config) {
    sandbox::SandboxOptions options;
    options.skills_dir = config.skills_dir;
    options.max_output_bytes = config.sandbox_max_output_bytes;
    return options;
}

} // namespace

GatewayContext::GatewayContext(GatewayConfig cfg, auth::CredentialTable table, core::NowFn now)
    : config(std::move(cfg))
    , events(config.audit_max_events, now)
    , credentials(std::move(table))
    , credential_validator(credentials, events)
    , rate_limiter(events, {}, now)
    , ip_reputation(events, {}, now)
    , tokens(token_secret_from(config.token_secret), events,
             std::chrono::duration_cast<std::chrono::seconds>(config.token_ttl), now)
    , command_validator(config.sandbox_allow, config.sandbox_bin_dirs)
    , executor(command_validator, events, sandbox_options_from(config))
    , permissions(config.permissions_file(), events)
    , manifests(skills::load_manifests(config.skills_dir, config.sandbox_timeout))
    , router(events) {
    router.add_skill(std::make_shared<skills::NoteSkill>(config.notes_file()));
    router.add_skill(std::make_shared<skills::TimeSkill>(now));
    router.add_skill(std::make_shared<skills::CalcSkill>());
    router.add_skill(std::make_shared<skills::OpenUrlSkill>());

    for (const auto& manifest : manifests) {
        router.add_skill(std::make_shared<skills::SandboxedSkill>(manifest, executor, permissions, events));
    }

    spdlog::info("Gateway context ready: {} credentials, {} skills ({} sandboxed)",
                 credentials.size(), router.skills().size(), manifests.size());
}

} // namespace voxgate::gateway
