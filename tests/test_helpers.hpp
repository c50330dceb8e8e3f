#pragma once

#include <scfw/http.hpp>
#include <scfw/platform.hpp>

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace scfw_test {

namespace fs = std::filesystem;

// Scratch directory removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "scfw_test") {
        path_ = fs::temp_directory_path() / (prefix + "_" + scfw::generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    std::string str() const { return path_.string(); }
    std::string operator/(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

inline void write_file(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream(path, std::ios::binary) << content;
}

// Write an executable shell script
inline void write_script(const std::string& path, const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body);
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);
}

// Canned responses keyed by URL; unknown URLs fail like an unreachable host.
// POSTs to the same URL are answered from the queue in order.
class FakeHttpClient : public scfw::HttpClient {
public:
    void respond(const std::string& url, int status, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        scfw::HttpResponse response;
        response.status_code = status;
        response.body = body;
        responses_[url].push_back(response);
    }

    scfw::HttpResponse request(const scfw::HttpRequest& req) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(req);
        auto it = responses_.find(req.url);
        if (it == responses_.end() || it->second.empty()) {
            scfw::HttpResponse failure;
            failure.error = "Couldn't connect to server";
            return failure;
        }
        scfw::HttpResponse response = it->second.front();
        if (it->second.size() > 1) it->second.erase(it->second.begin());
        return response;
    }

    std::vector<scfw::HttpRequest> requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    std::mutex mutex_;
    std::map<std::string, std::vector<scfw::HttpResponse>> responses_;
    std::vector<scfw::HttpRequest> requests_;
};

} // namespace scfw_test
