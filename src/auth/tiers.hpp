#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace voxgate::auth {

// Requests allowed per sliding window for one credential tier
struct RateProfile {
    size_t limit = 100;
    std::chrono::seconds window{3600};
};

// admin, user, local, demo
const std::vector<std::string>& known_tiers();

// Permission set granted to a tier; unknown tiers get read-only.
std::vector<std::string> tier_permissions(const std::string& tier);

// Rate profile for a tier; unknown tiers fall back to the user profile.
RateProfile tier_rate_profile(const std::string& tier);

bool has_permission(const std::vector<std::string>& permissions, const std::string& permission);

} // namespace voxgate::auth
