#include "auth/tiers.hpp"
#include <algorithm>

namespace voxgate::auth {

const std::vector<std::string>& known_tiers() {
    static const std::vector<std::string> tiers = {"admin", "user", "local", "demo"};
    return tiers;
}

std::vector<std::string> tier_permissions(const std::string& tier) {
    if (tier == "admin") return {"read", "write", "delete", "admin", "system", "control"};
    if (tier == "user")  return {"read", "write", "voice", "chat"};
    if (tier == "local") return {"read", "write", "voice", "chat", "test"};
    if (tier == "demo")  return {"read", "voice"};
    return {"read"};
}

RateProfile tier_rate_profile(const std::string& tier) {
    using std::chrono::seconds;
    if (tier == "admin") return {1000, seconds(3600)};
    if (tier == "local") return {500, seconds(3600)};
    if (tier == "demo")  return {50, seconds(3600)};
    return {100, seconds(3600)};
}

bool has_permission(const std::vector<std::string>& permissions, const std::string& permission) {
    return std::find(permissions.begin(), permissions.end(), permission) != permissions.end();
}

} // namespace voxgate::auth
