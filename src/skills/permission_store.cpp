#include "skills/permission_store.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <stdexcept>
#include <sys/file.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace voxgate::skills {

namespace {

// Exclusive advisory lock on a sidecar file, shared with other processes.
class FileLock {
public:
    explicit FileLock(const std::string& path) {
        fd_ = open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
        if (fd_ < 0) {
            throw std::runtime_error("cannot open lock file " + path + ": " + std::strerror(errno));
        }
        while (flock(fd_, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd_);
            throw std::runtime_error("cannot lock " + path + ": " + std::strerror(err));
        }
    }

    // Closing the descriptor releases the lock.
    ~FileLock() { close(fd_); }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

} // namespace

PermissionStore::PermissionStore(std::filesystem::path path, audit::SecurityEventLog& events)
    : path_(std::move(path)), events_(events) {}

std::map<std::string, bool> PermissionStore::read_table() const {
    std::map<std::string, bool> table;

    std::ifstream file(path_);
    if (!file.is_open()) {
        return table;
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("Permission file {} is unreadable, treating all permissions as denied", path_.string());
        return table;
    }

    auto perms = j.find("permissions");
    if (perms == j.end() || !perms->is_object()) {
        return table;
    }
    for (const auto& [name, granted] : perms->items()) {
        table[name] = granted.is_boolean() && granted.get<bool>();
    }
    return table;
}

void PermissionStore::write_table(const std::map<std::string, bool>& table) {
    json j;
    j["permissions"] = json::object();
    for (const auto& [name, granted] : table) {
        j["permissions"][name] = granted;
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    const std::string tmp_path = path_.string() + ".tmp." + std::to_string(getpid());
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("cannot write " + tmp_path);
        }
        out << j.dump(2) << "\n";
        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(tmp_path, ec);
            throw std::runtime_error("short write to " + tmp_path);
        }
    }

    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        throw std::runtime_error("cannot replace " + path_.string() + ": " + ec.message());
    }
}

void PermissionStore::set(const std::string& name, bool granted) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    FileLock file_lock(path_.string() + ".lock");

    auto table = read_table();
    table[name] = granted;
    write_table(table);
}

bool PermissionStore::is_granted(const std::string& name) const {
    auto table = read_table();
    auto it = table.find(name);
    return it != table.end() && it->second;
}

void PermissionStore::grant(const std::string& name) {
    set(name, true);
    events_.record(audit::events::PERMISSION_GRANTED, "local", {{"permission", name}});
}

void PermissionStore::revoke(const std::string& name) {
    set(name, false);
    events_.record(audit::events::PERMISSION_REVOKED, "local", {{"permission", name}});
}

json PermissionStore::request_permission(const std::string& name) const {
    return json{{"permission", name}, {"granted", is_granted(name)}};
}

json PermissionStore::grant_permission(const std::string& name) {
    grant(name);
    return json{{"permission", name}, {"granted", true}};
}

std::map<std::string, bool> PermissionStore::list() const {
    return read_table();
}

} // namespace voxgate::skills
