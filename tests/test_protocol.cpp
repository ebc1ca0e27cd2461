#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

#include "protocol.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

TEST_CASE("JSON-RPC codec", "[protocol]") {

    SECTION("EncodeRequestIsOneLine") {
        rpc::Request req{.id = 7, .method = "tools/call",
                         .params = {{"name", "analyzeCode"},
                                    {"arguments", {{"code", "line one\nline two"}}}}};
        auto line = rpc::encode_request(req);

        REQUIRE(line.back() == '\n');
        REQUIRE(line.find('\n') == line.size() - 1);

        auto j = json::parse(line);
        REQUIRE(j["jsonrpc"] == "2.0");
        REQUIRE(j["id"] == 7);
        REQUIRE(j["method"] == "tools/call");
        REQUIRE(j["params"]["arguments"]["code"] == "line one\nline two");
    }

    SECTION("EncodeNullParamsAsEmptyObject") {
        rpc::Request req{.id = 1, .method = "initialize", .params = nullptr};
        auto j = json::parse(rpc::encode_request(req));
        REQUIRE(j["params"].is_object());
        REQUIRE(j["params"].empty());
    }

    SECTION("EncodeInvalidUtf8DoesNotThrow") {
        rpc::Request req{.id = 2, .method = "tools/call",
                         .params = {{"code", std::string("bad \xff byte")}}};
        std::string line;
        REQUIRE_NOTHROW(line = rpc::encode_request(req));
        REQUIRE(json::accept(line));
    }

    SECTION("DecodeResult") {
        auto resp = rpc::decode_response(R"({"jsonrpc":"2.0","id":3,"result":{"ok":true}})");
        REQUIRE(resp.has_value());
        REQUIRE(resp->id == 3);
        REQUIRE_FALSE(resp->is_error());
        REQUIRE((*resp->result)["ok"] == true);
    }

    SECTION("DecodeRemoteErrorIsData") {
        auto resp = rpc::decode_response(
            R"({"jsonrpc":"2.0","id":4,"error":{"code":-32601,"message":"Unknown method x","data":null}})");
        REQUIRE(resp.has_value());
        REQUIRE(resp->is_error());
        REQUIRE_FALSE(resp->result.has_value());
        REQUIRE(resp->error->code == -32601);
        REQUIRE(resp->error->message == "Unknown method x");
    }

    SECTION("DecodeNullErrorWithResult") {
        auto resp = rpc::decode_response(R"({"jsonrpc":"2.0","id":5,"result":1,"error":null})");
        REQUIRE(resp.has_value());
        REQUIRE_FALSE(resp->is_error());
    }

    SECTION("DecodeFailures") {
        const char* bad[] = {
            "not json",
            "[1,2,3]",
            R"({"jsonrpc":"2.0","result":{}})",
            R"({"jsonrpc":"2.0","id":"abc","result":{}})",
            R"({"jsonrpc":"2.0","id":1})",
            R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"m"}})",
            R"({"jsonrpc":"2.0","id":1,"error":"boom"})",
            R"({"jsonrpc":"1.0","id":1,"result":{}})",
        };
        for (const char* line : bad) {
            auto resp = rpc::decode_response(line);
            INFO(line);
            REQUIRE_FALSE(resp.has_value());
            REQUIRE(resp.error().kind == rpc::ErrorKind::Decode);
        }
    }

    SECTION("DescribeNamesKind") {
        rpc::Error err{rpc::ErrorKind::Transport, "server closed its output"};
        REQUIRE(rpc::describe(err) == "transport failure: server closed its output");
    }
}
