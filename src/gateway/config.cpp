#include "gateway/config.hpp"
#include "core/config.hpp"
#include "core/paths.hpp"

namespace voxgate::gateway {

GatewayConfig GatewayConfig::from_env() {
    namespace cfg = core::config;

    GatewayConfig config;

    auto state_dir = cfg::get_env("VOXGATE_STATE_DIR");
    config.state_dir = state_dir.empty() ? core::paths::default_state_dir()
                                         : std::filesystem::path(state_dir);

    auto skills_dir = cfg::get_env("VOXGATE_SKILLS_DIR");
    if (!skills_dir.empty()) {
        config.skills_dir = skills_dir;
    } else if (auto found = core::paths::find_relative("skills_registry")) {
        config.skills_dir = *found;
    } else {
        config.skills_dir = config.state_dir / "skills";
    }

    auto credentials = cfg::get_env("VOXGATE_CREDENTIALS_FILE");
    config.credentials_file = credentials.empty() ? config.state_dir / "credentials.json"
                                                  : std::filesystem::path(credentials);

    config.token_secret = cfg::get_env("VOXGATE_TOKEN_SECRET");

    long ttl_hours = cfg::get_env_long("VOXGATE_TOKEN_TTL_HOURS", 24);
    if (ttl_hours > 0) {
        config.token_ttl = std::chrono::hours(ttl_hours);
    }

    long timeout_s = cfg::get_env_long("VOXGATE_SANDBOX_TIMEOUT_S", 3);
    if (timeout_s > 0) {
        config.sandbox_timeout = std::chrono::seconds(timeout_s);
    }

    config.sandbox_allow = cfg::get_env_list("VOXGATE_SANDBOX_ALLOW");
    config.sandbox_bin_dirs = cfg::get_env_list("VOXGATE_SANDBOX_BIN_DIRS");

    long max_events = cfg::get_env_long("VOXGATE_AUDIT_MAX_EVENTS", 1000);
    if (max_events > 0) {
        config.audit_max_events = static_cast<size_t>(max_events);
    }

    config.log_level = cfg::get_env_or("VOXGATE_LOG_LEVEL", "info");
    return config;
}

} // namespace voxgate::gateway
