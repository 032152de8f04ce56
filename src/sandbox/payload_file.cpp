#include "sandbox/payload_file.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>
#include <unistd.h>
#include <spdlog/spdlog.h>

namespace voxgate::sandbox {

PayloadFile::PayloadFile(const std::filesystem::path& dir, const nlohmann::json& payload) {
    // Serialized first: dump() throws on invalid UTF-8 and nothing may exist yet.
    const std::string body = payload.dump();

    std::string pattern = (dir / "voxgate-payload-XXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    // mkstemp creates the file with mode 0600
    int fd = mkstemp(buf.data());
    if (fd < 0) {
        throw std::runtime_error(std::string("cannot create payload file: ") + std::strerror(errno));
    }
    path_ = buf.data();

    size_t written = 0;
    while (written < body.size()) {
        ssize_t n = write(fd, body.data() + written, body.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            close(fd);
            unlink(path_.c_str());
            throw std::runtime_error(std::string("cannot write payload file: ") + std::strerror(err));
        }
        written += static_cast<size_t>(n);
    }

    if (close(fd) != 0) {
        int err = errno;
        unlink(path_.c_str());
        throw std::runtime_error(std::string("cannot close payload file: ") + std::strerror(err));
    }
}

PayloadFile::~PayloadFile() {
    if (!path_.empty() && unlink(path_.c_str()) != 0 && errno != ENOENT) {
        spdlog::warn("Failed to remove payload file {}: {}", path_, std::strerror(errno));
    }
}

} // namespace voxgate::sandbox
