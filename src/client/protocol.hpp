#pragma once

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

// JSON-RPC 2.0 message codec for the newline-delimited stdio transport.
namespace rpc {

inline constexpr std::string_view kVersion = "2.0";

struct Request {
    int64_t id = 0;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
};

struct RemoteError {
    int code = 0;
    std::string message;
    nlohmann::json data; // null when the server sent none
};

// Exactly one of result/error is set on a decoded response.
struct Response {
    int64_t id = 0;
    std::optional<nlohmann::json> result;
    std::optional<RemoteError> error;

    bool is_error() const { return error.has_value(); }
};

enum class ErrorKind {
    Spawn,             // child could not be launched
    Transport,         // broken pipe, end of stream, timeout
    Decode,            // response line is not a valid JSON-RPC response
    ProtocolViolation, // response id does not match the request id
    Busy,              // a call is already in flight on this channel
};

struct Error {
    ErrorKind kind;
    std::string message;
};

std::string_view to_string(ErrorKind kind);

// "<kind>: <message>"
std::string describe(const Error& err);

// Serialize to a single line terminated by '\n'.
std::string encode_request(const Request& req);

std::expected<Response, Error> decode_response(std::string_view line);

} // namespace rpc
