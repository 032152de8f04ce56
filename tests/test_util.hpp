#pragma once
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include "core/clock.hpp"

namespace voxgate::testutil {

// Fresh directory under the system temp dir, removed with its contents.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

    size_t file_count() const;

private:
    std::filesystem::path path_;
};

// Manually advanced time source. Copies of now_fn() follow advance().
class ManualClock {
public:
    ManualClock();

    core::NowFn now_fn() const;
    core::TimePoint now() const { return *current_; }

    void advance(std::chrono::milliseconds delta) { *current_ += delta; }
    void set(core::TimePoint tp) { *current_ = tp; }

private:
    std::shared_ptr<core::TimePoint> current_;
};

std::string read_file(const std::filesystem::path& path);
void write_file(const std::filesystem::path& path, const std::string& content);

} // namespace voxgate::testutil
