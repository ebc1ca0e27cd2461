#pragma once

#include "platform/server_process.hpp"

#include <cstddef>
#include <sys/types.h>

class PipeProcess : public ServerProcess {
public:
    PipeProcess();
    ~PipeProcess() override;

    PipeProcess(const PipeProcess&) = delete;
    PipeProcess& operator=(const PipeProcess&) = delete;

    std::expected<void, std::string> spawn(const ServerCommand& command) override;
    bool is_running() override;
    std::expected<void, std::string> write_line(std::string_view line) override;
    std::expected<std::string, std::string> read_line(int timeout_ms = -1) override;
    std::string stderr_output() const override { return stderr_buf_; }

    // SIGTERM, then SIGKILL after the grace period. Reaps the child.
    void terminate() override;

    pid_t pid() const { return pid_; }

    // Exit status from waitpid(), valid once the child has been reaped.
    int exit_status() const { return exit_status_; }

private:
    static constexpr int kTermGraceMs = 2000;
    static constexpr size_t kMaxStderrBytes = 64 * 1024;

    bool try_extract_line(std::string& line);
    void drain_stderr();
    void close_fds();

    pid_t pid_ = -1;
    bool reaped_ = false;
    int exit_status_ = 0;

    int stdin_fd_ = -1;  // parent writes
    int stdout_fd_ = -1; // parent reads
    int stderr_fd_ = -1; // parent reads, non-blocking

    std::string stdout_buf_;
    std::string stderr_buf_;
};
