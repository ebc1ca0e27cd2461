#include "analyzer_client.hpp"

#include "platform/linux/pipe_process.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

AnalyzerClient::AnalyzerClient(ServerCommand command, std::unique_ptr<ServerProcess> process,
                               int timeout_ms, bool verbose)
    : command_(std::move(command)), process_(std::move(process)),
      channel_(*process_, timeout_ms, verbose), verbose_(verbose) {}

AnalyzerClient::AnalyzerClient(ServerCommand command, int timeout_ms, bool verbose)
    : AnalyzerClient(std::move(command), std::make_unique<PipeProcess>(), timeout_ms, verbose) {}

AnalyzerClient::~AnalyzerClient() {
    stop();
}

std::expected<std::string, rpc::Error> AnalyzerClient::start() {
    if (started_) return server_name_;

    if (auto res = process_->spawn(command_); !res) {
        return std::unexpected(rpc::Error{rpc::ErrorKind::Spawn, res.error()});
    }
    started_ = true;
    channel_.reopen();
    log("spawned " + command_.executable);

    auto resp = channel_.call("initialize", json::object());
    if (!resp) {
        log("handshake failed: " + rpc::describe(resp.error()));
        process_->terminate();
        started_ = false;
        return std::unexpected(resp.error());
    }

    server_name_ = "?";
    if (resp->result && resp->result->is_object()) {
        auto& r = *resp->result;
        if (r.contains("serverInfo") && r["serverInfo"].is_object()) {
            auto& info = r["serverInfo"];
            if (info.contains("name") && info["name"].is_string()) {
                server_name_ = info["name"].get<std::string>();
            }
        }
    } else if (resp->is_error()) {
        log("initialize returned error: " + resp->error->message);
    }

    return server_name_;
}

void AnalyzerClient::stop() {
    if (!started_) return;

    // The server may already be gone or hung; termination proceeds regardless.
    if (channel_.closed()) {
        log("channel closed, skipping shutdown request");
    } else if (auto res = channel_.call("shutdown", json::object(), kShutdownTimeoutMs); !res) {
        log("shutdown request failed (ignored): " + rpc::describe(res.error()));
    }

    process_->terminate();
    started_ = false;
    log("server stopped");
}

std::expected<rpc::Response, rpc::Error>
AnalyzerClient::call(const std::string& method, const json& params) {
    return channel_.call(method, params);
}

std::expected<std::vector<ToolDescriptor>, rpc::Error> AnalyzerClient::list_tools() {
    auto result = call_result("tools/list", json::object());
    if (!result) return std::unexpected(result.error());

    std::vector<ToolDescriptor> tools;
    if (!result->contains("tools") || !(*result)["tools"].is_array()) return tools;

    for (auto& t : (*result)["tools"]) {
        if (!t.is_object()) continue;
        ToolDescriptor desc;
        if (t.contains("name") && t["name"].is_string()) desc.name = t["name"].get<std::string>();
        if (t.contains("description") && t["description"].is_string()) {
            desc.description = t["description"].get<std::string>();
        }
        tools.push_back(std::move(desc));
    }
    return tools;
}

AnalyzerClient::Result AnalyzerClient::analyze_code(const std::string& code) {
    return call_tool("analyzeCode", {{"sources", json::array({{{"code", code}}})}});
}

AnalyzerClient::Result AnalyzerClient::analyze_file(const std::string& path) {
    return call_tool("analyzeFile", {{"path", absolute_path(path)}});
}

AnalyzerClient::Result AnalyzerClient::convert_to_graph(const std::string& code,
                                                        std::optional<int> tier) {
    json args = {{"code", code}};
    if (tier) args["tier"] = *tier;
    return call_tool("convertToGraph", std::move(args));
}

AnalyzerClient::Result AnalyzerClient::convert_auth(const std::string& code,
                                                    const std::string& auth_method) {
    return call_tool("convertAuth", {{"code", code}, {"authMethod", auth_method}});
}

AnalyzerClient::Result AnalyzerClient::get_roadmap(const std::string& sdk_qualified_name) {
    return call_tool("getRoadmap", {{"sdkQualifiedName", sdk_qualified_name}});
}

AnalyzerClient::Result AnalyzerClient::migration_readiness(const std::string& root_path,
                                                           int max_files) {
    if (auto res = add_allowed_path(root_path); !res) return res;
    return call_tool("getMigrationReadiness",
                     {{"rootPath", absolute_path(root_path)}, {"maxFiles", max_files}});
}

AnalyzerClient::Result AnalyzerClient::add_allowed_path(const std::string& path) {
    return call_tool("addAllowedPath", {{"path", absolute_path(path)}});
}

AnalyzerClient::Result AnalyzerClient::convert_project(const std::string& root_path,
                                                       int max_files, bool dry_run) {
    if (auto res = add_allowed_path(root_path); !res) return res;
    return call_tool("convertToGraph", {{"rootPath", absolute_path(root_path)},
                                        {"maxFiles", max_files},
                                        {"dryRun", dry_run}});
}

AnalyzerClient::Result AnalyzerClient::list_resources() {
    return call_result("resources/list", json::object());
}

AnalyzerClient::Result AnalyzerClient::read_resource(const std::string& uri) {
    return call_result("resources/read", {{"uri", uri}});
}

AnalyzerClient::Result AnalyzerClient::list_prompts() {
    return call_result("prompts/list", json::object());
}

AnalyzerClient::Result AnalyzerClient::get_prompt(const std::string& name, const json& arguments) {
    return call_result("prompts/get", {{"name", name}, {"arguments", arguments}});
}

std::string AnalyzerClient::absolute_path(const std::string& path) {
    std::error_code ec;
    fs::path abs = path.empty() ? fs::current_path(ec) : fs::absolute(path, ec);
    if (ec) abs = path;

    auto s = abs.lexically_normal().string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

AnalyzerClient::Result AnalyzerClient::call_tool(const std::string& name, json arguments) {
    return call_result("tools/call", {{"name", name}, {"arguments", std::move(arguments)}});
}

AnalyzerClient::Result AnalyzerClient::call_result(const std::string& method, const json& params) {
    auto resp = channel_.call(method, params);
    if (!resp) return std::unexpected(resp.error());

    if (resp->is_error()) {
        log(std::format("{} returned error {}: {}", method, resp->error->code, resp->error->message));
        return json::object();
    }
    return *resp->result;
}

void AnalyzerClient::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "client: {}", msg);
    }
}
