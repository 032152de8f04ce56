#pragma once
#include <set>
#include <string>
#include <vector>

namespace voxgate::sandbox {

// Known-safe executables (basename of argv[0]).
const std::set<std::string>& default_allowed_commands();

// Substrings rejected anywhere in the space-joined argv.
const std::vector<std::string>& dangerous_patterns();

// Directories an absolute argv[0] may live in, with trailing slash.
const std::vector<std::string>& default_binary_dirs();

// Pure, fail-closed predicate over an argument vector. Nothing is executed.
class CommandValidator {
public:
    CommandValidator();
    CommandValidator(const std::vector<std::string>& extra_commands,
                     const std::vector<std::string>& extra_binary_dirs);

    // Throws core::SecurityViolation describing the first rule broken.
    void validate(const std::vector<std::string>& argv) const;

    // Non-throwing form; reason receives the violation when rejected.
    bool is_allowed(const std::vector<std::string>& argv, std::string* reason = nullptr) const;

    const std::set<std::string>& allowed_commands() const { return allowed_; }
    const std::vector<std::string>& binary_dirs() const { return binary_dirs_; }

private:
    std::set<std::string> allowed_;
    std::vector<std::string> binary_dirs_;
};

} // namespace voxgate::sandbox
