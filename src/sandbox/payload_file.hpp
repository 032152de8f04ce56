#pragma once
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace voxgate::sandbox {

// Private (0600) temp file holding a JSON request for a skill process.
// The file is removed when the object is destroyed, on every exit path.
class PayloadFile {
public:
    // Throws std::runtime_error if the file cannot be created or written, and
    // nlohmann::json::type_error if the payload holds invalid UTF-8.
    PayloadFile(const std::filesystem::path& dir, const nlohmann::json& payload);
    ~PayloadFile();

    PayloadFile(const PayloadFile&) = delete;
    PayloadFile& operator=(const PayloadFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace voxgate::sandbox
