#pragma once
#include <string>

namespace voxgate::gateway {

// Lifecycle of one gateway request. A rejection before EXECUTING goes
// straight to FAILED.
enum class RequestStage {
    UNVALIDATED,
    RATE_CHECKED,
    PERMISSION_CHECKED,
    EXECUTING,
    COMPLETED,
    FAILED,
    TIMEOUT
};

inline const char* request_stage_to_string(RequestStage stage) {
    switch (stage) {
        case RequestStage::UNVALIDATED:        return "unvalidated";
        case RequestStage::RATE_CHECKED:       return "rate_checked";
        case RequestStage::PERMISSION_CHECKED: return "permission_checked";
        case RequestStage::EXECUTING:          return "executing";
        case RequestStage::COMPLETED:          return "completed";
        case RequestStage::FAILED:             return "failed";
        case RequestStage::TIMEOUT:            return "timeout";
        default: return "unknown";
    }
}

} // namespace voxgate::gateway
