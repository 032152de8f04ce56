#include "auth/credentials.hpp"
#include "core/crypto.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace voxgate::auth {

namespace {

const std::vector<std::string> BLACKLISTED_KEY_PATTERNS = {
    "admin", "root", "test", "hack", "exploit",
    "sql", "injection", "xss", "script"
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

void CredentialTable::set(const std::string& key_name, const std::string& key, const std::string& tier) {
    Credential cred;
    cred.key_name = key_name;
    cred.key = key;
    cred.tier = tier;
    cred.permissions = tier_permissions(tier);
    cred.rate = tier_rate_profile(tier);

    for (auto& existing : entries_) {
        if (existing.key_name == key_name) {
            existing = std::move(cred);
            return;
        }
    }
    entries_.push_back(std::move(cred));
}

std::string CredentialTable::generate_key() {
    return "vg_" + core::crypto::random_hex(20);
}

CredentialTable CredentialTable::load_or_generate(const std::filesystem::path& path) {
    CredentialTable table;
    std::error_code ec;

    if (std::filesystem::exists(path, ec)) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open credentials file: " + path.string());
        }
        json j;
        try {
            file >> j;
        } catch (const json::exception& e) {
            throw std::runtime_error("malformed credentials file " + path.string() + ": " + e.what());
        }
        for (const auto& [name, entry] : j.items()) {
            std::string key = entry.value("key", "");
            std::string tier = entry.value("tier", "user");
            if (key.empty()) {
                spdlog::warn("Credential {} has no key, skipping", name);
                continue;
            }
            table.set(name, key, tier);
        }
        spdlog::info("Loaded {} credentials from {}", table.size(), path.string());
        return table;
    }

    json j = json::object();
    for (const auto& tier : known_tiers()) {
        std::string name = "voxgate_" + tier;
        std::string key = generate_key();
        table.set(name, key, tier);
        j[name] = {{"key", key}, {"tier", tier}};
    }

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    {
        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("cannot write credentials file: " + path.string());
        }
        // Restrict before any key material is written.
        std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            throw std::runtime_error("cannot restrict credentials file: " + ec.message());
        }
        out << j.dump(2) << "\n";
    }
    spdlog::info("Generated {} credentials in {}", table.size(), path.string());
    return table;
}

CredentialValidator::CredentialValidator(const CredentialTable& table, audit::SecurityEventLog& events)
    : events_(events) {
    entries_.reserve(table.size());
    for (const auto& cred : table.entries()) {
        entries_.push_back(Entry{cred, core::crypto::sha256(cred.key)});
    }
}

bool CredentialValidator::matches_blacklist(const std::string& key) {
    auto lowered = to_lower(key);
    for (const auto& pattern : BLACKLISTED_KEY_PATTERNS) {
        if (lowered.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string CredentialValidator::redact(const std::string& key) {
    return key.substr(0, 10) + "...";
}

CredentialCheck CredentialValidator::validate(const std::string& key, const std::string& source) const {
    CredentialCheck check;

    if (key.size() < MIN_KEY_LENGTH) {
        events_.record(audit::events::INVALID_KEY_FORMAT, source, {{"key_length", key.size()}});
        return check;
    }

    if (matches_blacklist(key)) {
        events_.record(audit::events::BLACKLISTED_KEY, source, {{"api_key", redact(key)}});
        return check;
    }

    // Digests have equal length, so every comparison costs the same; no early exit.
    const auto presented = core::crypto::sha256(key);
    const Entry* match = nullptr;
    for (const auto& entry : entries_) {
        if (core::crypto::constant_time_equals(presented, entry.digest)) {
            match = &entry;
        }
    }

    if (match == nullptr) {
        events_.record(audit::events::INVALID_API_KEY, source, {{"api_key", redact(key)}});
        return check;
    }

    check.valid = true;
    check.key_name = match->credential.key_name;
    check.tier = match->credential.tier;
    check.permissions = match->credential.permissions;
    check.rate = match->credential.rate;

    events_.record(audit::events::VALID_API_KEY, source,
                   {{"key_name", check.key_name}, {"key_type", check.tier}});
    return check;
}

} // namespace voxgate::auth
