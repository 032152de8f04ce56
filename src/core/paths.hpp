#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace voxgate::core::paths {

// Best-effort path to current executable; empty if unavailable.
std::filesystem::path executable_path();

// Best-effort directory of the current executable; empty if unavailable.
std::filesystem::path executable_dir();

// Common search roots for project-relative assets (.env, skills_registry).
std::vector<std::filesystem::path> project_search_paths();

// Find a relative path under any of the search roots.
std::optional<std::filesystem::path> find_relative(const std::string& relative);

// Default directory for grants, notes and generated credentials:
// $XDG_STATE_HOME/voxgate, then ~/.local/state/voxgate, then ./.voxgate
std::filesystem::path default_state_dir();

// Create the directory (and parents) if missing. Returns false on failure.
bool ensure_dir(const std::filesystem::path& dir);

} // namespace voxgate::core::paths
