#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace voxgate::gateway {

// Gateway configuration
struct GatewayConfig {
    std::filesystem::path state_dir;          // grants, notes, generated credentials
    std::filesystem::path skills_dir;         // <skills_dir>/<name>/skill.json
    std::filesystem::path credentials_file;

    std::string token_secret;                 // empty = random per process
    std::chrono::hours token_ttl{24};

    std::chrono::milliseconds sandbox_timeout{3000};   // manifests without timeout_s
    std::vector<std::string> sandbox_allow;            // added to the command allow-list
    std::vector<std::string> sandbox_bin_dirs;         // added to the approved binary dirs
    size_t sandbox_max_output_bytes = 1 << 20;

    size_t audit_max_events = 1000;
    std::string log_level = "info";

    std::filesystem::path permissions_file() const { return state_dir / "permissions.json"; }
    std::filesystem::path notes_file() const { return state_dir / "notes.md"; }

    // Reads VOXGATE_* variables (after .env loading) and fills in defaults.
    static GatewayConfig from_env();
};

} // namespace voxgate::gateway
