#include "rpc_channel.hpp"

#include <format>
#include <print>

RpcChannel::RpcChannel(ServerProcess& process, int timeout_ms, bool verbose)
    : process_(process), timeout_ms_(timeout_ms), verbose_(verbose) {}

std::expected<rpc::Response, rpc::Error>
RpcChannel::call(const std::string& method, const nlohmann::json& params,
                 std::optional<int> timeout_ms) {
    if (in_flight_.exchange(true)) {
        return std::unexpected(rpc::Error{
            rpc::ErrorKind::Busy,
            std::format("'{}' issued while another request is in flight", method)});
    }

    struct InFlightReset {
        std::atomic<bool>& flag;
        ~InFlightReset() { flag.store(false); }
    } reset{in_flight_};

    if (closed()) {
        return std::unexpected(rpc::Error{
            rpc::ErrorKind::Transport,
            std::format("channel closed, '{}' not sent: {}", method, closed_reason_)});
    }

    rpc::Request req{.id = ++next_id_, .method = method, .params = params};
    auto line = rpc::encode_request(req);
    log("-> " + line.substr(0, line.size() - 1));

    if (auto res = process_.write_line(line); !res) {
        return std::unexpected(close(res.error()));
    }

    auto reply = process_.read_line(timeout_ms.value_or(timeout_ms_));
    if (!reply) {
        return std::unexpected(close(std::format("no response to '{}' (id {}): {}",
                                                 method, req.id, reply.error())));
    }
    log("<- " + *reply);

    auto resp = rpc::decode_response(*reply);
    if (!resp) return resp;

    if (resp->id != req.id) {
        return std::unexpected(rpc::Error{
            rpc::ErrorKind::ProtocolViolation,
            std::format("response id {} does not match request id {}", resp->id, req.id)});
    }

    return resp;
}

rpc::Error RpcChannel::close(std::string reason) {
    closed_ = true;
    closed_reason_ = reason;
    log("closed: " + closed_reason_);
    return rpc::Error{rpc::ErrorKind::Transport, std::move(reason)};
}

void RpcChannel::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "rpc: {}", msg);
    }
}
