#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "audit/security_events.hpp"
#include "sandbox/command_validator.hpp"

namespace voxgate::sandbox {

struct SandboxOptions {
    std::filesystem::path skills_dir;   // <skills_dir>/<skill> becomes the working directory
    std::filesystem::path payload_dir;  // empty = system temp directory
    size_t max_output_bytes = 1 << 20;
    uint64_t max_memory_bytes = 0;
};

struct SkillInvocationResult {
    std::string skill_name;
    std::vector<std::string> args;
    int exit_code = 0;
    std::string output;
    std::chrono::milliseconds duration{0};
};

// Runs skill plugins as separate processes. Request goes to the child as a
// JSON file whose path is the last argument; the reply is the child's stdout.
class SkillSandboxExecutor {
public:
    SkillSandboxExecutor(const CommandValidator& validator, audit::SecurityEventLog& events,
                         SandboxOptions options = {});

    // Throws core::SecurityViolation (nothing spawned), core::SandboxTimeout,
    // or core::SandboxExecutionError (non-zero exit or spawn failure).
    SkillInvocationResult execute(const std::vector<std::string>& argv,
                                  const nlohmann::json& payload,
                                  std::chrono::milliseconds timeout,
                                  const std::string& skill_name = "");

    const SandboxOptions& options() const { return options_; }

private:
    std::string working_dir_for(const std::string& skill_name) const;

    const CommandValidator& validator_;
    audit::SecurityEventLog& events_;
    SandboxOptions options_;
};

} // namespace voxgate::sandbox
