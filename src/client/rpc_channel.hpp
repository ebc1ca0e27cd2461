#pragma once

#include "platform/server_process.hpp"
#include "protocol.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Synchronous JSON-RPC over a ServerProcess. One request in flight at a time:
// call() writes a request line and reads exactly one response line before
// returning. A second call() while one is pending fails with ErrorKind::Busy.
// The first transport failure (write error, end of stream, timeout) closes the
// channel: a late reply may still be queued, so later calls fail with
// ErrorKind::Transport without touching the process until reopen().
class RpcChannel {
public:
    explicit RpcChannel(ServerProcess& process, int timeout_ms = -1, bool verbose = false);

    RpcChannel(const RpcChannel&) = delete;
    RpcChannel& operator=(const RpcChannel&) = delete;

    // timeout_ms overrides the channel timeout for this call only.
    std::expected<rpc::Response, rpc::Error>
        call(const std::string& method, const nlohmann::json& params = nlohmann::json::object(),
             std::optional<int> timeout_ms = std::nullopt);

    bool closed() const { return closed_; }

    // Call once a fresh process is attached.
    void reopen() {
        closed_ = false;
        closed_reason_.clear();
    }

    // Id assigned to the most recent request, 0 before the first call.
    int64_t last_id() const { return next_id_.load(); }

    // timeout_ms < 0 blocks until the server answers.
    void set_timeout(int timeout_ms) { timeout_ms_ = timeout_ms; }

private:
    rpc::Error close(std::string reason);
    void log(const std::string& msg);

    ServerProcess& process_;
    int timeout_ms_;
    bool verbose_;
    bool closed_ = false;
    std::string closed_reason_;
    std::atomic<int64_t> next_id_{0};
    std::atomic<bool> in_flight_{false};
};
