#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "auth/tiers.hpp"
#include "audit/security_events.hpp"

namespace voxgate::auth {

struct Credential {
    std::string key_name;   // e.g. "voxgate_admin"
    std::string key;
    std::string tier;
    std::vector<std::string> permissions;
    RateProfile rate;
};

// Known credentials, built once at startup.
class CredentialTable {
public:
    // Insert or replace the entry named key_name.
    void set(const std::string& key_name, const std::string& key, const std::string& tier);

    const std::vector<Credential>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

    // Loads {"<key_name>": {"key": "...", "tier": "..."}} from path. When the
    // file is missing, one key per known tier is generated and written there
    // with mode 0600. Throws std::runtime_error on an unreadable file.
    static CredentialTable load_or_generate(const std::filesystem::path& path);

    // "vg_" followed by 40 random hex characters.
    static std::string generate_key();

private:
    std::vector<Credential> entries_;
};

struct CredentialCheck {
    bool valid = false;
    std::string key_name;
    std::string tier;
    std::vector<std::string> permissions;
    RateProfile rate;
};

// Fail-closed API key validation.
class CredentialValidator {
public:
    static constexpr size_t MIN_KEY_LENGTH = 10;

    CredentialValidator(const CredentialTable& table, audit::SecurityEventLog& events);

    CredentialCheck validate(const std::string& key, const std::string& source = "") const;

    size_t credential_count() const { return entries_.size(); }

    static bool matches_blacklist(const std::string& key);

    // First characters of a key followed by "...", for logs and events.
    static std::string redact(const std::string& key);

private:
    struct Entry {
        Credential credential;
        std::vector<uint8_t> digest;
    };

    std::vector<Entry> entries_;
    audit::SecurityEventLog& events_;
};

} // namespace voxgate::auth
