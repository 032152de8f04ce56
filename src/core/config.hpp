#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace voxgate::core::config {

// Load environment variables from a .env file (idempotent).
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Integer environment variable; fallback when missing or not a number.
long get_env_long(const std::string& key, long fallback);

// Comma-separated environment variable, entries trimmed, empties dropped.
std::vector<std::string> get_env_list(const std::string& key);

} // namespace voxgate::core::config
