#pragma once
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace voxgate::core {

enum class ErrorCode {
    AUTHENTICATION,      // Missing, invalid or blacklisted credential
    RATE_LIMITED,        // Sliding window exhausted
    IP_BLOCKED,          // Source address temporarily blocked
    PERMISSION_DENIED,   // Grant or tier permission missing
    SECURITY_VIOLATION,  // Command rejected before execution
    SANDBOX_TIMEOUT,     // Child killed after timeout
    SANDBOX_EXECUTION,   // Child exited non-zero or failed to spawn
    SKILL_NOT_FOUND,
    INVALID_REQUEST,
    INTERNAL
};

const char* error_code_to_string(ErrorCode code);

// Base of every error this layer raises. Carries a machine-readable code and
// structured detail that the gateway copies into the response.
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorCode code, const std::string& message,
                 nlohmann::json detail = nlohmann::json::object())
        : std::runtime_error(message), code_(code), detail_(std::move(detail)) {}

    ErrorCode code() const { return code_; }
    const nlohmann::json& detail() const { return detail_; }

    nlohmann::json to_json() const;

private:
    ErrorCode code_;
    nlohmann::json detail_;
};

class AuthenticationError : public GatewayError {
public:
    explicit AuthenticationError(const std::string& message)
        : GatewayError(ErrorCode::AUTHENTICATION, message) {}
};

class RateLimitExceeded : public GatewayError {
public:
    RateLimitExceeded(double retry_after, nlohmann::json detail)
        : GatewayError(ErrorCode::RATE_LIMITED, "rate limit exceeded", std::move(detail)),
          retry_after_(retry_after) {}

    double retry_after() const { return retry_after_; }

private:
    double retry_after_;
};

class IPBlocked : public GatewayError {
public:
    IPBlocked(const std::string& ip, double block_until)
        : GatewayError(ErrorCode::IP_BLOCKED, "IP temporarily blocked",
                       {{"ip", ip}, {"block_until", block_until}}) {}
};

class PermissionDenied : public GatewayError {
public:
    explicit PermissionDenied(const std::string& permission)
        : GatewayError(ErrorCode::PERMISSION_DENIED,
                       "permission '" + permission + "' required",
                       {{"permission", permission}}) {}
};

class SecurityViolation : public GatewayError {
public:
    explicit SecurityViolation(const std::string& reason)
        : GatewayError(ErrorCode::SECURITY_VIOLATION, reason) {}
};

class SandboxTimeout : public GatewayError {
public:
    SandboxTimeout(const std::string& skill, long timeout_ms)
        : GatewayError(ErrorCode::SANDBOX_TIMEOUT, "timeout",
                       {{"skill", skill}, {"timeout_ms", timeout_ms}}) {}
};

class SandboxExecutionError : public GatewayError {
public:
    SandboxExecutionError(int exit_code, const std::string& output)
        : GatewayError(ErrorCode::SANDBOX_EXECUTION, output, {{"exit_code", exit_code}}),
          exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

class SkillNotFound : public GatewayError {
public:
    explicit SkillNotFound(const std::string& skill)
        : GatewayError(ErrorCode::SKILL_NOT_FOUND, "skill not found: " + skill,
                       {{"skill", skill}}) {}
};

class InvalidRequest : public GatewayError {
public:
    explicit InvalidRequest(const std::string& message)
        : GatewayError(ErrorCode::INVALID_REQUEST, message) {}
};

} // namespace voxgate::core
