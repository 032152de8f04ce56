#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "audit/security_events.hpp"
#include "sandbox/executor.hpp"
#include "skills/permission_store.hpp"
#include "skills/skill.hpp"

namespace voxgate::skills {

// <skills_dir>/<name>/skill.json
struct SkillManifest {
    std::string name;
    std::vector<std::string> command;
    std::string permission;
    std::chrono::milliseconds timeout{3000};
    std::vector<std::string> triggers;
    std::string description;

    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{3000};

    // Throws core::InvalidRequest when a field is missing or has the wrong type.
    static SkillManifest from_json(const std::string& name, const nlohmann::json& j,
                                   std::chrono::milliseconds default_timeout = DEFAULT_TIMEOUT);
    nlohmann::json to_json() const;
};

// Manifests sorted by skill name. Unreadable or invalid manifests are
// skipped with a warning.
std::vector<SkillManifest> load_manifests(
    const std::filesystem::path& skills_dir,
    std::chrono::milliseconds default_timeout = SkillManifest::DEFAULT_TIMEOUT);

// A manifest skill. Every call checks its grant, then runs the manifest
// command in the sandbox with the request as the payload file.
class SandboxedSkill : public Skill {
public:
    SandboxedSkill(SkillManifest manifest,
                   sandbox::SkillSandboxExecutor& executor,
                   const PermissionStore& permissions,
                   audit::SecurityEventLog& events);

    std::string name() const override { return manifest_.name; }
    std::string description() const override { return manifest_.description; }
    bool can_handle(const std::string& text) const override;
    nlohmann::json handle(const std::string& text, const nlohmann::json& context) override;
    nlohmann::json invoke(const nlohmann::json& args, const nlohmann::json& context) override;

    const SkillManifest& manifest() const { return manifest_; }

private:
    nlohmann::json run(const nlohmann::json& payload, const nlohmann::json& context);

    SkillManifest manifest_;
    sandbox::SkillSandboxExecutor& executor_;
    const PermissionStore& permissions_;
    audit::SecurityEventLog& events_;
};

} // namespace voxgate::skills
