#include "sandbox/command_validator.hpp"
#include "core/errors.hpp"
#include <filesystem>

namespace voxgate::sandbox {

const std::set<std::string>& default_allowed_commands() {
    static const std::set<std::string> commands = {
        // Audio/media (TTS playback)
        "aplay", "paplay", "ffmpeg", "sox",
        // GPU and system monitoring
        "nvidia-smi", "rocm-smi", "intel_gpu_top",
        // TTS engines
        "espeak", "espeak-ng", "festival",
        // Network discovery
        "nmap", "arp", "ping", "host", "dig",
        // System utilities
        "which", "whereis", "lsof", "ps", "top", "htop"
    };
    return commands;
}

const std::vector<std::string>& dangerous_patterns() {
    static const std::vector<std::string> patterns = {
        "&&", "||", ";", "|", ">", "<", ">>",      // chaining and redirection
        "$(", "`", "${",                           // command substitution
        "rm ", "del ", "format ", "mkfs",          // destructive commands
        "sudo ", "su ", "chmod +s",                // privilege escalation
        "curl ", "wget ", "nc ", "netcat",         // network fetch
        "python ", "perl ", "ruby ", "bash ", "sh " // script interpreters
    };
    return patterns;
}

const std::vector<std::string>& default_binary_dirs() {
    static const std::vector<std::string> dirs = {"/usr/bin/", "/bin/", "/usr/local/bin/"};
    return dirs;
}

CommandValidator::CommandValidator()
    : allowed_(default_allowed_commands()), binary_dirs_(default_binary_dirs()) {}

CommandValidator::CommandValidator(const std::vector<std::string>& extra_commands,
                                   const std::vector<std::string>& extra_binary_dirs)
    : CommandValidator() {
    for (const auto& cmd : extra_commands) {
        allowed_.insert(cmd);
    }
    for (auto dir : extra_binary_dirs) {
        if (dir.empty()) continue;
        if (dir.back() != '/') dir.push_back('/');
        binary_dirs_.push_back(dir);
    }
}

bool CommandValidator::is_allowed(const std::vector<std::string>& argv, std::string* reason) const {
    auto fail = [reason](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };

    if (argv.empty()) {
        return fail("Empty command");
    }

    const std::string command_name = std::filesystem::path(argv[0]).filename().string();
    if (allowed_.count(command_name) == 0) {
        return fail("Command not in whitelist: " + command_name);
    }

    std::string full_command;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) full_command.push_back(' ');
        full_command += argv[i];
    }
    for (const auto& pattern : dangerous_patterns()) {
        if (full_command.find(pattern) != std::string::npos) {
            return fail("Dangerous pattern detected: " + pattern);
        }
    }

    if (!argv[0].empty() && argv[0][0] == '/') {
        if (argv[0].find("..") != std::string::npos) {
            return fail("Path traversal attempt: " + argv[0]);
        }
        bool approved = false;
        for (const auto& dir : binary_dirs_) {
            if (argv[0].compare(0, dir.size(), dir) == 0) {
                approved = true;
                break;
            }
        }
        if (!approved) {
            return fail("Unsafe absolute path: " + argv[0]);
        }
    }

    for (size_t i = 1; i < argv.size(); ++i) {
        const auto& arg = argv[i];
        if (!arg.empty() && arg[0] == '/' && arg.find("..") != std::string::npos) {
            return fail("Path traversal attempt: " + arg);
        }
    }

    return true;
}

void CommandValidator::validate(const std::vector<std::string>& argv) const {
    std::string reason;
    if (!is_allowed(argv, &reason)) {
        throw core::SecurityViolation(reason);
    }
}

} // namespace voxgate::sandbox
