#include "sandbox/executor.hpp"
#include "sandbox/payload_file.hpp"
#include "sandbox/process.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace voxgate::sandbox {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

SkillSandboxExecutor::SkillSandboxExecutor(const CommandValidator& validator,
                                           audit::SecurityEventLog& events,
                                           SandboxOptions options)
    : validator_(validator), events_(events), options_(std::move(options)) {
    if (options_.payload_dir.empty()) {
        options_.payload_dir = std::filesystem::temp_directory_path();
    }
}

std::string SkillSandboxExecutor::working_dir_for(const std::string& skill_name) const {
    if (skill_name.empty() || options_.skills_dir.empty()) {
        return "";
    }
    std::error_code ec;
    auto dir = options_.skills_dir / skill_name;
    if (std::filesystem::is_directory(dir, ec)) {
        return dir.string();
    }
    return "";
}

SkillInvocationResult SkillSandboxExecutor::execute(const std::vector<std::string>& argv,
                                                    const nlohmann::json& payload,
                                                    std::chrono::milliseconds timeout,
                                                    const std::string& skill_name) {
    const auto started = std::chrono::steady_clock::now();
    const nlohmann::json context{{"skill", skill_name},
                                 {"command", argv.empty() ? "" : argv[0]}};

    auto reject = [&](const core::SecurityViolation& e) {
        nlohmann::json details = context;
        details["reason"] = e.what();
        events_.record(audit::events::SECURITY_VIOLATION, "local", details);
    };

    // Checked once before the payload file exists and once with its path.
    try {
        validator_.validate(argv);
    } catch (const core::SecurityViolation& e) {
        reject(e);
        throw;
    }

    PayloadFile payload_file(options_.payload_dir, payload);

    std::vector<std::string> full_argv = argv;
    full_argv.push_back(payload_file.path());
    try {
        validator_.validate(full_argv);
    } catch (const core::SecurityViolation& e) {
        reject(e);
        throw;
    }

    ProcessSpec spec;
    spec.argv = full_argv;
    spec.cwd = working_dir_for(skill_name);
    spec.timeout = timeout;
    spec.max_output_bytes = options_.max_output_bytes;
    spec.max_memory_bytes = options_.max_memory_bytes;

    spdlog::debug("Sandbox exec skill={} cmd={} cwd={}", skill_name, argv[0],
                  spec.cwd.empty() ? "." : spec.cwd);
    ProcessResult proc = run_process(spec);

    SkillInvocationResult result;
    result.skill_name = skill_name;
    result.args = argv;
    result.exit_code = proc.exit_code;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (proc.timed_out) {
        nlohmann::json details = context;
        details["timeout_ms"] = timeout.count();
        events_.record(audit::events::SANDBOX_TIMEOUT, "local", details);
        throw core::SandboxTimeout(skill_name, static_cast<long>(timeout.count()));
    }

    if (proc.spawn_failed || !proc.error_message.empty() || proc.exit_code != 0) {
        std::string message = proc.error_message;
        if (message.empty()) message = trim(proc.stderr_text);
        if (message.empty()) message = trim(proc.stdout_text);
        if (message.empty()) message = "exit code " + std::to_string(proc.exit_code);

        nlohmann::json details = context;
        details["exit_code"] = proc.exit_code;
        details["duration_ms"] = result.duration.count();
        events_.record(audit::events::SANDBOX_ERROR, "local", details);
        throw core::SandboxExecutionError(proc.exit_code, message);
    }

    result.output = trim(proc.stdout_text);
    if (proc.stdout_truncated) {
        spdlog::warn("Skill {} output truncated at {} bytes", skill_name, options_.max_output_bytes);
    }

    nlohmann::json details = context;
    details["exit_code"] = 0;
    details["duration_ms"] = result.duration.count();
    events_.record(audit::events::SKILL_EXECUTED, "local", details);
    return result;
}

} // namespace voxgate::sandbox
