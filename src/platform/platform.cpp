#include "kit/platform.hpp"

#include <chrono>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kit {

namespace fs = std::filesystem;

namespace {

bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

// Write the whole buffer, retrying on short writes and EINTR
bool write_all(int fd, const char* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        ssize_t rc = write(fd, data + written, size - written);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(rc);
    }
    return true;
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;

    std::string dir_path = get_parent_directory(path);
    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!write_all(fd, content.data(), content.size())) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to write content";
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
    return result;
}

AtomicWriteResult durable_append_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;

    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (fd < 0) {
        result.error = "failed to open " + path + ": " + std::string(strerror(errno));
        return result;
    }

    if (!write_all(fd, content.data(), content.size())) {
        result.error = "failed to append to " + path + ": " + std::string(strerror(errno));
        close(fd);
        return result;
    }

    if (!fsync_fd(fd)) {
        result.error = "failed to fsync " + path;
        close(fd);
        return result;
    }

    if (close(fd) != 0) {
        result.error = "failed to close " + path + ": " + std::string(strerror(errno));
        return result;
    }

    result.ok = true;
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return p.string();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::optional<std::string> find_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) == 0 && is_regular_file(name)) {
            return name;
        }
        return std::nullopt;
    }

    auto path_env = get_env("PATH");
    if (!path_env) return std::nullopt;

    std::stringstream ss(*path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = join_path(dir, name);
        if (access(candidate.c_str(), X_OK) == 0 && is_regular_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

} // namespace kit
