#include "util/atomic_file.hpp"
#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace hive::util {

static std::atomic<uint64_t> g_temp_counter{0};

bool write_file_atomic(const std::string& path, const std::string& content) {
    fs::path target(path);
    fs::path tmp = target.parent_path() /
        ("." + target.filename().string() + "." + std::to_string(getpid()) +
         "." + std::to_string(g_temp_counter++) + ".tmp");

    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        spdlog::error("Failed to create {}: {}", tmp.string(), strerror(errno));
        return false;
    }

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("Failed to write {}: {}", tmp.string(), strerror(errno));
            close(fd);
            unlink(tmp.c_str());
            return false;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    if (fsync(fd) < 0) {
        spdlog::warn("fsync failed for {}: {}", tmp.string(), strerror(errno));
    }
    close(fd);

    if (rename(tmp.c_str(), target.c_str()) < 0) {
        spdlog::error("Failed to rename {} -> {}: {}", tmp.string(), target.string(), strerror(errno));
        unlink(tmp.c_str());
        return false;
    }

    // Make the rename itself durable
    int dir_fd = open(target.parent_path().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd >= 0) {
        fsync(dir_fd);
        close(dir_fd);
    }
    return true;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace hive::util
