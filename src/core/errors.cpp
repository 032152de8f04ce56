#include "core/errors.hpp"

namespace voxgate::core {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::AUTHENTICATION:     return "AUTH_INVALID";
        case ErrorCode::RATE_LIMITED:       return "RATE_LIMIT";
        case ErrorCode::IP_BLOCKED:         return "IP_BLOCKED";
        case ErrorCode::PERMISSION_DENIED:  return "PERMISSION_DENIED";
        case ErrorCode::SECURITY_VIOLATION: return "SECURITY_VIOLATION";
        case ErrorCode::SANDBOX_TIMEOUT:    return "SANDBOX_TIMEOUT";
        case ErrorCode::SANDBOX_EXECUTION:  return "SANDBOX_EXECUTION_ERROR";
        case ErrorCode::SKILL_NOT_FOUND:    return "SKILL_NOT_FOUND";
        case ErrorCode::INVALID_REQUEST:    return "INVALID_REQUEST";
        case ErrorCode::INTERNAL:           return "INTERNAL";
        default: return "UNKNOWN";
    }
}

nlohmann::json GatewayError::to_json() const {
    nlohmann::json j = detail_.is_object() ? detail_ : nlohmann::json::object();
    j["code"] = error_code_to_string(code_);
    j["message"] = what();
    return j;
}

} // namespace voxgate::core
