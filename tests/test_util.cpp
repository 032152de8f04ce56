#include "test_util.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace voxgate::testutil {

TempDir::TempDir() {
    std::string pattern = (std::filesystem::temp_directory_path() / "voxgate-test-XXXXXX").string();
    if (!mkdtemp(pattern.data())) {
        throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    path_ = pattern;
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

size_t TempDir::file_count() const {
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(path_)) {
        (void)entry;
        ++count;
    }
    return count;
}

ManualClock::ManualClock()
    : current_(std::make_shared<core::TimePoint>(
          core::TimePoint(std::chrono::seconds(1700000000)))) {}

core::NowFn ManualClock::now_fn() const {
    auto current = current_;
    return [current] { return *current; };
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

} // namespace voxgate::testutil
