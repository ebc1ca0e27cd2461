#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

struct ServerCommand {
    std::string executable;
    std::vector<std::string> args;
};

// A child process speaking a line protocol on its stdin/stdout.
class ServerProcess {
public:
    virtual ~ServerProcess() = default;

    virtual std::expected<void, std::string> spawn(const ServerCommand& command) = 0;
    virtual bool is_running() = 0;

    // Writes the whole line (caller supplies the terminator).
    virtual std::expected<void, std::string> write_line(std::string_view line) = 0;

    // Blocks until one full line arrives. timeout_ms < 0 waits forever.
    virtual std::expected<std::string, std::string> read_line(int timeout_ms = -1) = 0;

    // Whatever the child has written to stderr so far (bounded).
    virtual std::string stderr_output() const = 0;

    virtual void terminate() = 0;
};
