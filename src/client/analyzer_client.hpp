#pragma once

#include "platform/server_process.hpp"
#include "protocol.hpp"
#include "rpc_channel.hpp"

#include <expected>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct ToolDescriptor {
    std::string name;
    std::string description;
};

// Session with the EWS Migration Analyzer server: owns the child process and
// the RPC channel over its stdio. Tool wrappers return the "result" member of
// the response, or an empty object when the server answered with an error;
// use call() to see the error object.
class AnalyzerClient {
public:
    using Result = std::expected<nlohmann::json, rpc::Error>;

    AnalyzerClient(ServerCommand command, std::unique_ptr<ServerProcess> process,
                   int timeout_ms = -1, bool verbose = false);
    explicit AnalyzerClient(ServerCommand command, int timeout_ms = -1, bool verbose = false);
    ~AnalyzerClient();

    AnalyzerClient(const AnalyzerClient&) = delete;
    AnalyzerClient& operator=(const AnalyzerClient&) = delete;

    // Spawns the server and performs the initialize handshake. Returns the
    // server name ("?" if the server did not report one). On failure the
    // child is terminated.
    std::expected<std::string, rpc::Error> start();

    // Best-effort shutdown request (bounded by kShutdownTimeoutMs, skipped
    // once the channel is closed), then terminate. Safe to call repeatedly.
    void stop();

    bool started() const { return started_; }
    const std::string& server_name() const { return server_name_; }
    RpcChannel& channel() { return channel_; }
    ServerProcess& process() { return *process_; }

    // Raw round trip; the caller inspects result vs error.
    std::expected<rpc::Response, rpc::Error>
        call(const std::string& method, const nlohmann::json& params = nlohmann::json::object());

    std::expected<std::vector<ToolDescriptor>, rpc::Error> list_tools();
    Result analyze_code(const std::string& code);
    Result analyze_file(const std::string& path);
    Result convert_to_graph(const std::string& code, std::optional<int> tier = std::nullopt);
    Result convert_auth(const std::string& code, const std::string& auth_method = "clientCredential");
    Result get_roadmap(const std::string& sdk_qualified_name);
    // Registers root_path with add_allowed_path() first.
    Result migration_readiness(const std::string& root_path, int max_files = 500);
    Result add_allowed_path(const std::string& path);
    // Project-wide conversion; registers root_path first. Nothing is written
    // by the server while dry_run is set.
    Result convert_project(const std::string& root_path, int max_files = 200, bool dry_run = true);

    Result list_resources();
    Result read_resource(const std::string& uri);
    Result list_prompts();
    Result get_prompt(const std::string& name,
                      const nlohmann::json& arguments = nlohmann::json::object());

    // Absolute, lexically normal, no trailing separator.
    static std::string absolute_path(const std::string& path);

private:
    static constexpr int kShutdownTimeoutMs = 2000;

    Result call_tool(const std::string& name, nlohmann::json arguments);
    Result call_result(const std::string& method, const nlohmann::json& params);

    void log(const std::string& msg);

    ServerCommand command_;
    std::unique_ptr<ServerProcess> process_;
    RpcChannel channel_;
    bool verbose_;
    bool started_ = false;
    std::string server_name_;
};
