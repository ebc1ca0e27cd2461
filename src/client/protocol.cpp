#include "protocol.hpp"

#include <format>

using json = nlohmann::json;

namespace rpc {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Spawn: return "spawn failure";
        case ErrorKind::Transport: return "transport failure";
        case ErrorKind::Decode: return "protocol decode failure";
        case ErrorKind::ProtocolViolation: return "protocol violation";
        case ErrorKind::Busy: return "channel busy";
    }
    return "unknown";
}

std::string describe(const Error& err) {
    return std::format("{}: {}", to_string(err.kind), err.message);
}

std::string encode_request(const Request& req) {
    json j = {
        {"jsonrpc", std::string(kVersion)},
        {"id", req.id},
        {"method", req.method},
        {"params", req.params.is_null() ? json::object() : req.params},
    };
    // dump() without indent never emits a raw newline; strings are escaped.
    return j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

std::expected<Response, Error> decode_response(std::string_view line) {
    auto decode_error = [](std::string msg) {
        return std::unexpected(Error{ErrorKind::Decode, std::move(msg)});
    };

    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error& e) {
        return decode_error(std::string("invalid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        return decode_error("response is not a JSON object");
    }

    if (j.contains("jsonrpc") &&
        (!j["jsonrpc"].is_string() || j["jsonrpc"].get<std::string>() != kVersion)) {
        return decode_error("unsupported jsonrpc version: " + j["jsonrpc"].dump());
    }

    if (!j.contains("id") || !j["id"].is_number_integer()) {
        return decode_error("response has no integer id");
    }

    bool has_result = j.contains("result");
    bool has_error = j.contains("error") && !j["error"].is_null();
    if (has_result == has_error) {
        return decode_error("response must carry exactly one of result or error");
    }

    Response resp;
    resp.id = j["id"].get<int64_t>();

    if (has_result) {
        resp.result = std::move(j["result"]);
        return resp;
    }

    auto& e = j["error"];
    if (!e.is_object() || !e.contains("code") || !e["code"].is_number_integer() ||
        !e.contains("message") || !e["message"].is_string()) {
        return decode_error("malformed error object: " + e.dump());
    }

    RemoteError remote;
    remote.code = e["code"].get<int>();
    remote.message = e["message"].get<std::string>();
    if (e.contains("data")) remote.data = e["data"];
    resp.error = std::move(remote);
    return resp;
}

} // namespace rpc
