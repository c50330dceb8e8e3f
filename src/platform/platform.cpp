#include "scfw/platform.hpp"
#include "scfw/text_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace scfw {

namespace fs = std::filesystem;

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_executable_file(const std::string& path) {
    return is_regular_file(path) && access(path.c_str(), X_OK) == 0;
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (const auto& entry : fs::directory_iterator(path, ec)) {
        entries.push_back(entry.path().string());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool write_file_atomic(const std::string& path, const std::string& content) {
    std::string parent = fs::path(path).parent_path().string();
    if (!parent.empty() && !create_directories(parent)) {
        return false;
    }

    std::string temp_path = path + ".tmp." + generate_uuid().substr(0, 8);
    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return false;

    size_t written = 0;
    while (written < content.size()) {
        ssize_t rc = write(fd, content.data() + written, content.size() - written);
        if (rc < 0) {
            if (errno == EINTR) continue;
            close(fd);
            unlink(temp_path.c_str());
            return false;
        }
        written += static_cast<size_t>(rc);
    }

    bool synced = fsync(fd) == 0;
    bool closed = close(fd) == 0;
    if (!synced || !closed) {
        unlink(temp_path.c_str());
        return false;
    }
    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        return false;
    }
    return true;
}

bool append_file(const std::string& path, const std::string& content) {
    std::string parent = fs::path(path).parent_path().string();
    if (!parent.empty() && !create_directories(parent)) {
        return false;
    }

    // O_APPEND keeps concurrent writers from interleaving within a record
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) return false;

    size_t written = 0;
    while (written < content.size()) {
        ssize_t rc = write(fd, content.data() + written, content.size() - written);
        if (rc < 0) {
            if (errno == EINTR) continue;
            close(fd);
            return false;
        }
        written += static_cast<size_t>(rc);
    }
    return close(fd) == 0;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return fs::is_directory(path, ec);
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (base.empty()) return rel;
    if (rel.empty()) return base;
    return (fs::path(base) / rel).string();
}

std::optional<std::string> find_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) return name;
        return std::nullopt;
    }

    auto path_var = get_env("PATH");
    if (!path_var) return std::nullopt;

    for (const auto& dir : text::split(*path_var, ':')) {
        if (dir.empty()) continue;
        std::string candidate = join_path(dir, name);
        if (is_executable_file(candidate)) {
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

std::string home_directory() {
    return get_env("HOME").value_or("");
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

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace scfw
