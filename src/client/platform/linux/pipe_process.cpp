#include "platform/linux/pipe_process.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void close_pair(int p[2]) {
    for (int i = 0; i < 2; ++i) {
        if (p[i] >= 0) {
            ::close(p[i]);
            p[i] = -1;
        }
    }
}

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

} // namespace

PipeProcess::PipeProcess() = default;

PipeProcess::~PipeProcess() {
    terminate();
}

std::expected<void, std::string> PipeProcess::spawn(const ServerCommand& command) {
    if (is_running()) {
        return std::unexpected("process already running (pid " + std::to_string(pid_) + ")");
    }
    if (command.executable.empty()) {
        return std::unexpected("no executable configured");
    }

    // Leftovers from a previous child.
    terminate();
    stdout_buf_.clear();
    stderr_buf_.clear();
    exit_status_ = 0;

    // A write to a dead child must come back as EPIPE instead of killing us.
    ::signal(SIGPIPE, SIG_IGN);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1}; // carries errno if execvp() fails

    auto close_all = [&] {
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
    };

    if (::pipe2(in_pipe, O_CLOEXEC) < 0 || ::pipe2(out_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) < 0 || ::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        auto msg = errno_message("pipe2()");
        close_all();
        return std::unexpected(msg);
    }

    // Built before fork(): the child must not allocate.
    std::vector<char*> argv;
    argv.reserve(command.args.size() + 2);
    argv.push_back(const_cast<char*>(command.executable.c_str()));
    for (const auto& arg : command.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_message("fork()");
        close_all();
        return std::unexpected(msg);
    }

    if (pid == 0) {
        // dup2() clears FD_CLOEXEC on the target, everything else closes on exec.
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(in_pipe[0]);
    in_pipe[0] = -1;
    ::close(out_pipe[1]);
    out_pipe[1] = -1;
    ::close(err_pipe[1]);
    err_pipe[1] = -1;
    ::close(exec_pipe[1]);
    exec_pipe[1] = -1;

    // EOF here means exec succeeded and the write end was closed by O_CLOEXEC.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_pair(exec_pipe);

    if (n > 0) {
        int status;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_all();
        return std::unexpected(std::format("cannot execute {}: {}",
                                           command.executable, std::strerror(child_errno)));
    }

    pid_ = pid;
    reaped_ = false;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];

    int flags = ::fcntl(stderr_fd_, F_GETFL);
    if (flags >= 0) ::fcntl(stderr_fd_, F_SETFL, flags | O_NONBLOCK);

    return {};
}

bool PipeProcess::is_running() {
    if (pid_ <= 0 || reaped_) return false;

    int status;
    pid_t ret = ::waitpid(pid_, &status, WNOHANG);
    if (ret == 0) return true;
    if (ret == pid_) {
        reaped_ = true;
        exit_status_ = status;
    }
    return false;
}

std::expected<void, std::string> PipeProcess::write_line(std::string_view line) {
    if (stdin_fd_ < 0) {
        return std::unexpected("process not running");
    }

    size_t total_written = 0;
    while (total_written < line.size()) {
        ssize_t n = ::write(stdin_fd_, line.data() + total_written, line.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EPIPE) return std::unexpected("broken pipe: server is no longer reading");
            return std::unexpected(errno_message("write()"));
        }
        total_written += static_cast<size_t>(n);
    }
    return {};
}

std::expected<std::string, std::string> PipeProcess::read_line(int timeout_ms) {
    std::string line;
    if (try_extract_line(line)) return line;

    if (stdout_fd_ < 0) {
        return std::unexpected("process not running");
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left < 0) {
                return std::unexpected(std::format("timed out after {} ms waiting for a response",
                                                   timeout_ms));
            }
            wait_ms = static_cast<int>(left);
        }

        pollfd pfds[2] = {
            {.fd = stdout_fd_, .events = POLLIN, .revents = 0},
            {.fd = stderr_fd_, .events = POLLIN, .revents = 0},
        };
        nfds_t nfds = stderr_fd_ >= 0 ? 2 : 1;

        int ret = ::poll(pfds, nfds, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_message("poll()"));
        }
        if (ret == 0) {
            if (timeout_ms == 0) {
                return std::unexpected("timed out after 0 ms waiting for a response");
            }
            continue;
        }

        if (nfds == 2 && pfds[1].revents != 0) {
            drain_stderr();
        }

        if (pfds[0].revents == 0) continue;

        char tmp[4096];
        ssize_t n = ::read(stdout_fd_, tmp, sizeof(tmp));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_message("read()"));
        }
        if (n == 0) {
            bool partial = !stdout_buf_.empty();
            stdout_buf_.clear();
            return std::unexpected(partial ? "server closed its output mid-message"
                                           : "server closed its output");
        }

        stdout_buf_.append(tmp, static_cast<size_t>(n));
        if (try_extract_line(line)) return line;
    }
}

void PipeProcess::terminate() {
    if (pid_ > 0) {
        // EOF on stdin lets a well-behaved server exit on its own.
        if (stdin_fd_ >= 0) {
            ::close(stdin_fd_);
            stdin_fd_ = -1;
        }

        if (!reaped_ && is_running()) {
            ::kill(pid_, SIGTERM);
            for (int waited = 0; waited < kTermGraceMs && is_running(); waited += 10) {
                ::usleep(10000);
            }
        }

        if (!reaped_) {
            ::kill(pid_, SIGKILL);
            int status;
            pid_t ret;
            while ((ret = ::waitpid(pid_, &status, 0)) < 0 && errno == EINTR) {}
            if (ret == pid_) exit_status_ = status;
            reaped_ = true;
        }

        pid_ = -1;
    }

    close_fds();
}

bool PipeProcess::try_extract_line(std::string& line) {
    auto pos = stdout_buf_.find('\n');
    if (pos == std::string::npos) return false;

    line = stdout_buf_.substr(0, pos);
    stdout_buf_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

void PipeProcess::drain_stderr() {
    char tmp[4096];
    while (stderr_fd_ >= 0) {
        ssize_t n = ::read(stderr_fd_, tmp, sizeof(tmp));
        if (n > 0) {
            stderr_buf_.append(tmp, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
        // EOF or hard error: nothing more will come.
        ::close(stderr_fd_);
        stderr_fd_ = -1;
    }

    if (stderr_buf_.size() > kMaxStderrBytes) {
        stderr_buf_.erase(0, stderr_buf_.size() - kMaxStderrBytes);
    }
}

void PipeProcess::close_fds() {
    for (int* fd : {&stdin_fd_, &stdout_fd_, &stderr_fd_}) {
        if (*fd >= 0) {
            ::close(*fd);
            *fd = -1;
        }
    }
}
