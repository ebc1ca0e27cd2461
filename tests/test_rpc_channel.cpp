#include <catch2/catch_test_macros.hpp>

#include "platform/server_process.hpp"
#include "rpc_channel.hpp"

#include <deque>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

// Replays queued reply lines, or echoes each request's params as its result
// when echo is set.
class ScriptedProcess : public ServerProcess {
public:
    std::expected<void, std::string> spawn(const ServerCommand&) override {
        running = true;
        return {};
    }
    bool is_running() override { return running; }

    std::expected<void, std::string> write_line(std::string_view line) override {
        if (!running || write_fails) return std::unexpected("broken pipe: server is no longer reading");
        written.emplace_back(line);
        return {};
    }

    std::expected<std::string, std::string> read_line(int timeout_ms) override {
        last_timeout = timeout_ms;
        if (on_read) on_read();
        if (read_error) return std::unexpected(*read_error);
        if (echo) {
            auto req = json::parse(written.back());
            return json{{"jsonrpc", "2.0"}, {"id", req["id"]}, {"result", req["params"]}}.dump();
        }
        if (replies.empty()) return std::unexpected("server closed its output");
        auto line = replies.front();
        replies.pop_front();
        return line;
    }

    std::string stderr_output() const override { return {}; }
    void terminate() override { running = false; }

    bool running = true;
    bool write_fails = false;
    bool echo = false;
    std::optional<std::string> read_error;
    std::optional<int> last_timeout;
    std::function<void()> on_read;
    std::vector<std::string> written;
    std::deque<std::string> replies;
};

} // namespace

TEST_CASE("RpcChannel", "[rpc]") {
    ScriptedProcess process;
    RpcChannel channel(process);

    SECTION("IdsStartAtOneAndIncrease") {
        process.echo = true;
        REQUIRE(channel.last_id() == 0);

        for (int64_t expected = 1; expected <= 5; ++expected) {
            auto resp = channel.call("tools/list");
            REQUIRE(resp.has_value());
            REQUIRE(resp->id == expected);
            REQUIRE(channel.last_id() == expected);
        }

        REQUIRE(process.written.size() == 5);
        for (size_t i = 0; i < process.written.size(); ++i) {
            auto req = json::parse(process.written[i]);
            REQUIRE(req["id"] == static_cast<int64_t>(i + 1));
            REQUIRE(req["jsonrpc"] == "2.0");
            REQUIRE(req["method"] == "tools/list");
            REQUIRE(req["params"] == json::object());
        }
    }

    SECTION("EachRequestIsOneTerminatedLine") {
        process.echo = true;
        REQUIRE(channel.call("tools/call", {{"code", "a\nb\r\nc"}}).has_value());
        const auto& line = process.written.front();
        REQUIRE(line.back() == '\n');
        REQUIRE(line.find('\n') == line.size() - 1);
    }

    SECTION("EchoedResultEqualsParams") {
        process.echo = true;
        json params = {
            {"name", "analyzeCode"},
            {"arguments", {{"sources", json::array({{{"code", "var x = 1;"}}})},
                           {"nested", {{"n", 42}, {"f", 1.5}, {"b", false}, {"z", nullptr}}}}},
        };
        auto resp = channel.call("tools/call", params);
        REQUIRE(resp.has_value());
        REQUIRE(resp->result.has_value());
        REQUIRE(*resp->result == params);
    }

    SECTION("ClosedStreamIsTransportFailure") {
        auto resp = channel.call("tools/list");
        REQUIRE_FALSE(resp.has_value());
        REQUIRE(resp.error().kind == rpc::ErrorKind::Transport);
    }

    SECTION("WriteFailureIsTransportFailure") {
        process.write_fails = true;
        process.replies.push_back(R"({"jsonrpc":"2.0","id":1,"result":{}})");

        auto resp = channel.call("tools/list");
        REQUIRE_FALSE(resp.has_value());
        REQUIRE(resp.error().kind == rpc::ErrorKind::Transport);
        // Nothing was read after the failed write.
        REQUIRE(process.replies.size() == 1);
        REQUIRE(channel.closed());

        process.write_fails = false;
        auto next = channel.call("tools/list");
        REQUIRE_FALSE(next.has_value());
        REQUIRE(next.error().kind == rpc::ErrorKind::Transport);
        REQUIRE(process.written.empty());
    }

    SECTION("TimeoutClosesTheChannel") {
        channel.set_timeout(200);
        process.read_error = "timed out after 200 ms waiting for a response";

        auto first = channel.call("tools/list");
        REQUIRE_FALSE(first.has_value());
        REQUIRE(first.error().kind == rpc::ErrorKind::Transport);
        REQUIRE(first.error().message.find("timed out") != std::string::npos);
        REQUIRE(channel.closed());

        // The late reply to id 1 would be read next; the channel must not
        // hand it to a later request.
        process.read_error.reset();
        process.replies.push_back(R"({"jsonrpc":"2.0","id":1,"result":{}})");
        channel.set_timeout(-1);

        auto second = channel.call("tools/list");
        REQUIRE_FALSE(second.has_value());
        REQUIRE(second.error().kind == rpc::ErrorKind::Transport);
        REQUIRE(second.error().message.find("channel closed") != std::string::npos);
        REQUIRE(process.written.size() == 1);
        REQUIRE(process.replies.size() == 1);
        REQUIRE(channel.last_id() == 1);
    }

    SECTION("ReopenAcceptsCallsAgain") {
        process.read_error = "server closed its output";
        REQUIRE_FALSE(channel.call("tools/list").has_value());
        REQUIRE(channel.closed());

        process.read_error.reset();
        process.echo = true;
        channel.reopen();
        REQUIRE_FALSE(channel.closed());

        auto resp = channel.call("tools/list");
        REQUIRE(resp.has_value());
        REQUIRE(resp->id == 2);
    }

    SECTION("GarbageLineIsDecodeFailureAndChannelRecovers") {
        process.replies.push_back("this is not json");
        process.replies.push_back(R"({"jsonrpc":"2.0","id":2,"result":{"ok":true}})");

        auto bad = channel.call("tools/list");
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().kind == rpc::ErrorKind::Decode);

        REQUIRE_FALSE(channel.closed());

        auto good = channel.call("tools/list");
        REQUIRE(good.has_value());
        REQUIRE(good->id == 2);
        REQUIRE((*good->result)["ok"] == true);
    }

    SECTION("MismatchedIdIsProtocolViolation") {
        process.replies.push_back(R"({"jsonrpc":"2.0","id":99,"result":{}})");
        auto resp = channel.call("tools/list");
        REQUIRE_FALSE(resp.has_value());
        REQUIRE(resp.error().kind == rpc::ErrorKind::ProtocolViolation);
    }

    SECTION("RemoteErrorIsReturnedAsData") {
        process.replies.push_back(
            R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"path not allowed"}})");
        auto resp = channel.call("tools/call", {{"name", "analyzeFile"}});
        REQUIRE(resp.has_value());
        REQUIRE(resp->is_error());
        REQUIRE(resp->error->code == -32000);
        REQUIRE(resp->error->message == "path not allowed");
    }

    SECTION("ReentrantCallIsRejected") {
        process.echo = true;
        std::optional<std::expected<rpc::Response, rpc::Error>> nested;
        process.on_read = [&] {
            if (!nested) nested = channel.call("tools/list");
        };

        auto outer = channel.call("initialize");
        REQUIRE(outer.has_value());
        REQUIRE(outer->id == 1);

        REQUIRE(nested.has_value());
        REQUIRE_FALSE(nested->has_value());
        REQUIRE(nested->error().kind == rpc::ErrorKind::Busy);
        // The rejected call wrote nothing and consumed no id.
        REQUIRE(process.written.size() == 1);
        REQUIRE(channel.last_id() == 1);

        process.on_read = nullptr;
        auto next = channel.call("tools/list");
        REQUIRE(next.has_value());
        REQUIRE(next->id == 2);
    }

    SECTION("TimeoutIsPassedToTheProcess") {
        process.echo = true;
        REQUIRE(channel.call("tools/list").has_value());
        REQUIRE(process.last_timeout == -1);

        channel.set_timeout(250);
        REQUIRE(channel.call("tools/list").has_value());
        REQUIRE(process.last_timeout == 250);

        // A per-call timeout applies to that call only.
        REQUIRE(channel.call("shutdown", json::object(), 2000).has_value());
        REQUIRE(process.last_timeout == 2000);
        REQUIRE(channel.call("tools/list").has_value());
        REQUIRE(process.last_timeout == 250);
    }

    SECTION("DeadProcessFailsWithTransport") {
        process.terminate();
        auto resp = channel.call("tools/list");
        REQUIRE_FALSE(resp.has_value());
        REQUIRE(resp.error().kind == rpc::ErrorKind::Transport);
    }
}
