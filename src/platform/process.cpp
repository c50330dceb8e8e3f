#include "scfw/process.hpp"

#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace scfw {

namespace {

constexpr std::chrono::milliseconds kPollSlice{50};
constexpr std::chrono::milliseconds kTerminateGrace{500};

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    ~FileDescriptor() { reset(); }

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    void reset(int new_fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = new_fd;
    }

private:
    int fd_ = -1;
};

bool make_pipe(FileDescriptor& read_end, FileDescriptor& write_end) {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Read whatever is available; returns false on EOF or error
bool drain(int fd, std::string& sink) {
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            sink.append(buf, static_cast<size_t>(n));
            if (static_cast<size_t>(n) < sizeof(buf)) return true;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        return false;
    }
}

int terminate_child(pid_t pid) {
    ::kill(pid, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) return decode_status(status);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    return decode_status(status);
}

} // namespace

std::string format_command(const std::vector<std::string>& argv) {
    std::string result;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) result += " ";
        bool needs_quotes = argv[i].empty() || argv[i].find_first_of(" \t'\"") != std::string::npos;
        if (needs_quotes) result += "'";
        result += argv[i];
        if (needs_quotes) result += "'";
    }
    return result;
}

Result<ProcessResult> run_process(const std::vector<std::string>& argv,
                                  const ProcessOptions& options) {
    if (argv.empty() || argv[0].empty()) {
        return Result<ProcessResult>::err(Error(ErrorCode::INVALID_COMMAND, "empty command line"));
    }

    // Everything the child needs is prepared before fork
    std::vector<char*> c_argv;
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    FileDescriptor out_r, out_w, err_r, err_w, exec_r, exec_w;
    if (!make_pipe(exec_r, exec_w) ||
        (options.capture && (!make_pipe(out_r, out_w) || !make_pipe(err_r, err_w)))) {
        return Result<ProcessResult>::err(Error(ErrorCode::PROCESS_FAILED,
            "pipe failed: " + std::string(strerror(errno))));
    }

    pid_t pid = ::fork();
    if (pid == -1) {
        return Result<ProcessResult>::err(Error(ErrorCode::PROCESS_FAILED,
            "fork failed: " + std::string(strerror(errno))));
    }

    if (pid == 0) {
        // Child process
        if (options.capture) {
            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }
            ::dup2(out_w.get(), STDOUT_FILENO);
            ::dup2(err_w.get(), STDERR_FILENO);
        }
        if (!options.cwd.empty() && ::chdir(options.cwd.c_str()) != 0) {
            int e = errno;
            ssize_t ignored = ::write(exec_w.get(), &e, sizeof(e));
            (void)ignored;
            _exit(127);
        }

        ::execvp(c_argv[0], c_argv.data());

        // If execvp returns, it failed
        int e = errno;
        ssize_t ignored = ::write(exec_w.get(), &e, sizeof(e));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    exec_w.reset();
    out_w.reset();
    err_w.reset();

    // The exec pipe is closed by a successful exec, or carries errno
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_r.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        ErrorCode code = (child_errno == ENOENT || child_errno == EACCES || child_errno == ENOTDIR)
            ? ErrorCode::EXECUTABLE_NOT_FOUND : ErrorCode::PROCESS_FAILED;
        return Result<ProcessResult>::err(Error(code,
            "failed to execute '" + argv[0] + "': " + std::string(strerror(child_errno))));
    }

    ProcessResult result;
    auto started = std::chrono::steady_clock::now();

    if (out_r) ::fcntl(out_r.get(), F_SETFL, ::fcntl(out_r.get(), F_GETFL) | O_NONBLOCK);
    if (err_r) ::fcntl(err_r.get(), F_SETFL, ::fcntl(err_r.get(), F_GETFL) | O_NONBLOCK);

    for (;;) {
        if (options.cancel && options.cancel->cancelled()) {
            result.cancelled = true;
            result.exit_code = terminate_child(pid);
            return Result<ProcessResult>::ok(std::move(result));
        }
        if (options.timeout &&
            std::chrono::steady_clock::now() - started >= *options.timeout) {
            result.timed_out = true;
            result.exit_code = terminate_child(pid);
            return Result<ProcessResult>::ok(std::move(result));
        }

        if (out_r || err_r) {
            pollfd fds[2];
            nfds_t count = 0;
            if (out_r) fds[count++] = {out_r.get(), POLLIN, 0};
            if (err_r) fds[count++] = {err_r.get(), POLLIN, 0};

            int rc = ::poll(fds, count, static_cast<int>(kPollSlice.count()));
            if (rc < 0 && errno != EINTR) {
                result.exit_code = terminate_child(pid);
                return Result<ProcessResult>::err(Error(ErrorCode::PROCESS_FAILED,
                    "poll failed: " + std::string(strerror(errno))));
            }
            if (rc > 0) {
                for (nfds_t i = 0; i < count; ++i) {
                    if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                    bool is_out = out_r && fds[i].fd == out_r.get();
                    bool open = drain(fds[i].fd, is_out ? result.out : result.err);
                    if (!open) {
                        if (is_out) out_r.reset(); else err_r.reset();
                    }
                }
            }
            continue;
        }

        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            result.exit_code = decode_status(status);
            return Result<ProcessResult>::ok(std::move(result));
        }
        if (r < 0 && errno != EINTR) {
            return Result<ProcessResult>::err(Error(ErrorCode::PROCESS_FAILED,
                "waitpid failed: " + std::string(strerror(errno))));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace scfw
