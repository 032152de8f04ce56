#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "audit/security_events.hpp"

namespace voxgate::skills {

// Persisted permission grants. Reads always go to disk so grants changed by
// another process apply immediately; writes replace the file atomically.
class PermissionStore {
public:
    PermissionStore(std::filesystem::path path, audit::SecurityEventLog& events);

    // Unknown names, a missing file or an unreadable file all mean "not granted".
    bool is_granted(const std::string& name) const;

    // Throw std::runtime_error if the table cannot be persisted.
    void grant(const std::string& name);
    void revoke(const std::string& name);

    // {"permission": name, "granted": bool}
    nlohmann::json request_permission(const std::string& name) const;
    // {"permission": name, "granted": true}
    nlohmann::json grant_permission(const std::string& name);

    std::map<std::string, bool> list() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::map<std::string, bool> read_table() const;
    void write_table(const std::map<std::string, bool>& table);
    void set(const std::string& name, bool granted);

    std::filesystem::path path_;
    audit::SecurityEventLog& events_;
    std::mutex write_mutex_;
};

} // namespace voxgate::skills
