#include "skills/registry.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace voxgate::skills {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim_left(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    return start == std::string::npos ? "" : s.substr(start);
}

std::vector<std::string> string_array(const nlohmann::json& j, const char* field) {
    if (!j.is_array()) {
        throw core::InvalidRequest(std::string("manifest field '") + field + "' must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : j) {
        if (!item.is_string()) {
            throw core::InvalidRequest(std::string("manifest field '") + field + "' must be an array of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

// =============================================================================
// SkillManifest
// =============================================================================

SkillManifest SkillManifest::from_json(const std::string& name, const nlohmann::json& j,
                                       std::chrono::milliseconds default_timeout) {
    if (!j.is_object()) {
        throw core::InvalidRequest("manifest must be a JSON object");
    }
    if (!j.contains("command")) {
        throw core::InvalidRequest("manifest is missing 'command'");
    }

    SkillManifest m;
    m.name = name;
    m.command = string_array(j["command"], "command");
    if (m.command.empty()) {
        throw core::InvalidRequest("manifest 'command' is empty");
    }

    m.timeout = default_timeout;
    m.permission = "skill." + name;
    if (j.contains("permission")) {
        if (!j["permission"].is_string()) {
            throw core::InvalidRequest("manifest field 'permission' must be a string");
        }
        m.permission = j["permission"].get<std::string>();
    }

    if (j.contains("timeout_s")) {
        if (!j["timeout_s"].is_number() || j["timeout_s"].get<double>() <= 0) {
            throw core::InvalidRequest("manifest field 'timeout_s' must be a positive number");
        }
        m.timeout = std::chrono::milliseconds(
            static_cast<long long>(j["timeout_s"].get<double>() * 1000.0));
    }

    if (j.contains("triggers")) {
        for (auto& t : string_array(j["triggers"], "triggers")) {
            m.triggers.push_back(to_lower(t));
        }
    }

    m.description = j.value("description", "");
    return m;
}

nlohmann::json SkillManifest::to_json() const {
    return {
        {"name", name},
        {"command", command},
        {"permission", permission},
        {"timeout_s", timeout.count() / 1000.0},
        {"triggers", triggers},
        {"description", description}
    };
}

std::vector<SkillManifest> load_manifests(const std::filesystem::path& skills_dir,
                                          std::chrono::milliseconds default_timeout) {
    std::vector<SkillManifest> manifests;

    std::error_code ec;
    if (!std::filesystem::is_directory(skills_dir, ec)) {
        spdlog::debug("Skills directory {} not found", skills_dir.string());
        return manifests;
    }

    for (const auto& entry : std::filesystem::directory_iterator(skills_dir, ec)) {
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec)) continue;
        auto manifest_path = entry.path() / "skill.json";
        if (!std::filesystem::is_regular_file(manifest_path, entry_ec)) continue;

        std::string name = entry.path().filename().string();
        try {
            std::ifstream in(manifest_path);
            nlohmann::json j = nlohmann::json::parse(in);
            manifests.push_back(SkillManifest::from_json(name, j, default_timeout));
            spdlog::info("Loaded skill manifest '{}'", name);
        } catch (const std::exception& e) {
            spdlog::warn("Skipping skill manifest {}: {}", manifest_path.string(), e.what());
        }
    }
    if (ec) {
        spdlog::warn("Failed to scan skills directory {}: {}", skills_dir.string(), ec.message());
    }

    std::sort(manifests.begin(), manifests.end(),
              [](const SkillManifest& a, const SkillManifest& b) { return a.name < b.name; });
    return manifests;
}

// =============================================================================
// SandboxedSkill
// =============================================================================

SandboxedSkill::SandboxedSkill(SkillManifest manifest,
                               sandbox::SkillSandboxExecutor& executor,
                               const PermissionStore& permissions,
                               audit::SecurityEventLog& events)
    : manifest_(std::move(manifest))
    , executor_(executor)
    , permissions_(permissions)
    , events_(events) {}

bool SandboxedSkill::can_handle(const std::string& text) const {
    std::string lower = to_lower(trim_left(text));
    for (const auto& trigger : manifest_.triggers) {
        if (!trigger.empty() && lower.rfind(trigger, 0) == 0) {
            return true;
        }
    }
    return false;
}

nlohmann::json SandboxedSkill::handle(const std::string& text, const nlohmann::json& context) {
    return run({{"skill", manifest_.name}, {"text", text}}, context);
}

nlohmann::json SandboxedSkill::invoke(const nlohmann::json& args, const nlohmann::json& context) {
    return run({{"skill", manifest_.name}, {"args", args.is_null() ? nlohmann::json::object() : args}},
               context);
}

nlohmann::json SandboxedSkill::run(const nlohmann::json& payload, const nlohmann::json& context) {
    if (!permissions_.is_granted(manifest_.permission)) {
        std::string source = context.is_object() ? context.value("source", "") : "";
        events_.record(audit::events::PERMISSION_DENIED, source,
                       {{"skill", manifest_.name}, {"permission", manifest_.permission}});
        throw core::PermissionDenied(manifest_.permission);
    }

    nlohmann::json request = payload;
    if (context.is_object()) {
        request["context"] = context;
    }

    auto result = executor_.execute(manifest_.command, request, manifest_.timeout, manifest_.name);

    auto parsed = nlohmann::json::parse(result.output, nullptr, false);
    if (parsed.is_discarded()) {
        return {{"output", result.output}};
    }
    return parsed;
}

} // namespace voxgate::skills
