#include "analyzer_client.hpp"
#include "config.hpp"

#include <charconv>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

constexpr const char* kSampleEwsCode = R"(
using Microsoft.Exchange.WebServices.Data;

var service = new ExchangeService(ExchangeVersion.Exchange2013);
service.Credentials = new WebCredentials("user@contoso.com", "password");
var results = service.FindItems(WellKnownFolderName.Inbox, new ItemView(50));
)";

constexpr const char* kSampleCallSite =
    "service.FindItems(WellKnownFolderName.Inbox, new ItemView(50))";

constexpr const char* kSampleAuthCode =
    R"(var service = new ExchangeService(); service.Credentials = new WebCredentials("user", "pass");)";

constexpr const char* kSampleRoadmapName =
    "Microsoft.Exchange.WebServices.Data.ExchangeService.FindItems";

struct Options {
    std::string config_path;
    std::optional<std::string> server;
    std::optional<std::vector<std::string>> server_args;
    std::optional<int> timeout_ms;
    bool verbose = false;

    std::optional<int> tier;
    std::optional<std::string> auth_method;
    std::optional<int> max_files;
    bool apply = false;

    std::vector<std::string> positional;
};

void usage(const char* prog) {
    std::println(stderr, "Usage: {} [options] [command] [args]", prog);
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH       Settings file (default: {}, then {})",
                 kLocalSettingsPath, kDefaultSettingsPath);
    std::println(stderr, "  -s, --server EXE        Server executable");
    std::println(stderr, "  -a, --server-arg ARG    Server argument (repeatable, replaces configured args)");
    std::println(stderr, "  -t, --timeout MS        Response timeout (default: wait forever)");
    std::println(stderr, "  -v, --verbose           Trace requests and responses on stderr");
    std::println(stderr, "  -h, --help              Show this help");
    std::println(stderr, "Commands:");
    std::println(stderr, "  demo                              Walk through the sample tool calls (default)");
    std::println(stderr, "  tools                             List available tools");
    std::println(stderr, "  analyze-code CODE                 Analyze inline C# source");
    std::println(stderr, "  analyze-file PATH                 Analyze a C# file");
    std::println(stderr, "  convert CODE [--tier N]           Convert an EWS call site to Graph SDK");
    std::println(stderr, "  convert-auth CODE [--auth-method M]");
    std::println(stderr, "                                    Convert EWS authentication");
    std::println(stderr, "  roadmap NAME                      Migration roadmap for an EWS member");
    std::println(stderr, "  readiness ROOT [--max-files N]    Migration readiness of a project");
    std::println(stderr, "  convert-project ROOT [--max-files N] [--apply]");
    std::println(stderr, "                                    Convert a project (dry run unless --apply)");
    std::println(stderr, "  allow PATH                        Add a path to the server allowlist");
    std::println(stderr, "  resources                         List resources");
    std::println(stderr, "  read-resource URI                 Read a resource");
    std::println(stderr, "  prompts                           List prompts");
    std::println(stderr, "  prompt NAME [ARGS_JSON]           Get a prompt");
    std::println(stderr, "  call METHOD [PARAMS_JSON]         Raw JSON-RPC call, prints the full response");
}

std::optional<int> parse_int(const std::string& s) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

std::optional<json> parse_json_arg(const std::string& s) {
    try {
        return json::parse(s);
    } catch (const json::parse_error& e) {
        std::println(stderr, "Invalid JSON argument: {}", e.what());
        return std::nullopt;
    }
}

bool print_result(const AnalyzerClient::Result& result) {
    if (!result) {
        std::println(stderr, "Error: {}", rpc::describe(result.error()));
        return false;
    }
    std::println("{}", result->dump(2));
    return true;
}

bool print_tools(AnalyzerClient& client) {
    auto tools = client.list_tools();
    if (!tools) {
        std::println(stderr, "Error: {}", rpc::describe(tools.error()));
        return false;
    }
    for (const auto& tool : *tools) {
        std::println("  {:25} {}", tool.name, tool.description);
    }
    return true;
}

bool run_demo(AnalyzerClient& client, const Config& config) {
    std::println("─── Available Tools ───");
    if (!print_tools(client)) return false;
    std::println("");

    std::println("─── Analyzing EWS Code ───");
    if (!print_result(client.analyze_code(kSampleEwsCode))) return false;
    std::println("");

    std::println("─── Converting to Graph SDK ───");
    if (!print_result(client.convert_to_graph(kSampleCallSite))) return false;
    std::println("");

    std::println("─── Converting Authentication ───");
    if (!print_result(client.convert_auth(kSampleAuthCode, config.demo.auth_method))) return false;
    std::println("");

    std::println("─── Roadmap Lookup ───");
    if (!print_result(client.get_roadmap(kSampleRoadmapName))) return false;
    std::println("");

    return true;
}

// Returns false if the command name or its arguments are invalid.
bool validate(const std::string& command, const std::vector<std::string>& args) {
    struct Arity {
        const char* name;
        size_t min;
        size_t max;
    };
    static constexpr Arity commands[] = {
        {"demo", 0, 0},          {"tools", 0, 0},         {"analyze-code", 1, 1},
        {"analyze-file", 1, 1},  {"convert", 1, 1},       {"convert-auth", 1, 1},
        {"roadmap", 1, 1},       {"readiness", 1, 1},     {"convert-project", 1, 1},
        {"allow", 1, 1},         {"resources", 0, 0},     {"read-resource", 1, 1},
        {"prompts", 0, 0},       {"prompt", 1, 2},        {"call", 1, 2},
    };

    for (const auto& c : commands) {
        if (command != c.name) continue;
        if (args.size() < c.min || args.size() > c.max) {
            std::println(stderr, "Wrong number of arguments for '{}'", command);
            return false;
        }
        return true;
    }
    std::println(stderr, "Unknown command: {}", command);
    return false;
}

bool run_command(AnalyzerClient& client, const Config& config, const Options& opts,
                 const std::string& command, const std::vector<std::string>& args) {
    int max_files = opts.max_files.value_or(config.demo.max_files);

    if (command == "demo") return run_demo(client, config);
    if (command == "tools") return print_tools(client);
    if (command == "analyze-code") return print_result(client.analyze_code(args[0]));
    if (command == "analyze-file") return print_result(client.analyze_file(args[0]));
    if (command == "convert") return print_result(client.convert_to_graph(args[0], opts.tier));
    if (command == "convert-auth") {
        return print_result(client.convert_auth(args[0], opts.auth_method.value_or(config.demo.auth_method)));
    }
    if (command == "roadmap") return print_result(client.get_roadmap(args[0]));
    if (command == "readiness") return print_result(client.migration_readiness(args[0], max_files));
    if (command == "convert-project") {
        return print_result(client.convert_project(args[0], opts.max_files.value_or(200), !opts.apply));
    }
    if (command == "allow") return print_result(client.add_allowed_path(args[0]));
    if (command == "resources") return print_result(client.list_resources());
    if (command == "read-resource") return print_result(client.read_resource(args[0]));
    if (command == "prompts") return print_result(client.list_prompts());

    if (command == "prompt") {
        json prompt_args = json::object();
        if (args.size() > 1) {
            auto parsed = parse_json_arg(args[1]);
            if (!parsed) return false;
            prompt_args = std::move(*parsed);
        }
        return print_result(client.get_prompt(args[0], prompt_args));
    }

    if (command == "call") {
        json params = json::object();
        if (args.size() > 1) {
            auto parsed = parse_json_arg(args[1]);
            if (!parsed) return false;
            params = std::move(*parsed);
        }
        auto resp = client.call(args[0], params);
        if (!resp) {
            std::println(stderr, "Error: {}", rpc::describe(resp.error()));
            return false;
        }
        json out = {{"jsonrpc", "2.0"}, {"id", resp->id}};
        if (resp->is_error()) {
            out["error"] = {{"code", resp->error->code},
                            {"message", resp->error->message},
                            {"data", resp->error->data}};
        } else {
            out["result"] = *resp->result;
        }
        std::println("{}", out.dump(2));
        return true;
    }

    return false;
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 < argc) return std::string(argv[++i]);
            std::println(stderr, "Missing value for {}", arg);
            return std::nullopt;
        };
        auto next_int = [&]() -> std::optional<int> {
            auto v = next();
            if (!v) return std::nullopt;
            auto n = parse_int(*v);
            if (!n) std::println(stderr, "Expected a number for {}, got '{}'", arg, *v);
            return n;
        };

        if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--apply") {
            opts.apply = true;
        } else if (arg == "--config" || arg == "-c") {
            auto v = next();
            if (!v) return 1;
            opts.config_path = *v;
        } else if (arg == "--server" || arg == "-s") {
            auto v = next();
            if (!v) return 1;
            opts.server = *v;
        } else if (arg == "--server-arg" || arg == "-a") {
            auto v = next();
            if (!v) return 1;
            if (!opts.server_args) opts.server_args.emplace();
            opts.server_args->push_back(*v);
        } else if (arg == "--timeout" || arg == "-t") {
            opts.timeout_ms = next_int();
            if (!opts.timeout_ms) return 1;
        } else if (arg == "--tier") {
            opts.tier = next_int();
            if (!opts.tier) return 1;
        } else if (arg == "--max-files") {
            opts.max_files = next_int();
            if (!opts.max_files) return 1;
        } else if (arg == "--auth-method") {
            opts.auth_method = next();
            if (!opts.auth_method) return 1;
        } else {
            opts.positional.push_back(arg);
        }
    }

    std::string command = opts.positional.empty() ? "demo" : opts.positional.front();
    std::vector<std::string> args;
    if (!opts.positional.empty()) {
        args.assign(opts.positional.begin() + 1, opts.positional.end());
    }
    if (!validate(command, args)) {
        usage(argv[0]);
        return 1;
    }

    Config config = opts.config_path.empty() ? Config::load() : Config::load(opts.config_path, "");
    if (opts.server) config.server.command = *opts.server;
    if (opts.server_args) config.server.args = *opts.server_args;
    if (opts.timeout_ms) config.rpc.timeout_ms = *opts.timeout_ms;
    if (opts.verbose) config.verbose = true;

    AnalyzerClient client(config.server.to_command(), config.rpc.timeout_ms, config.verbose);

    auto name = client.start();
    if (!name) {
        std::println(stderr, "Failed to start MCP server: {}", rpc::describe(name.error()));
        auto diag = client.process().stderr_output();
        if (!diag.empty()) std::println(stderr, "Server stderr:\n{}", diag);
        return 1;
    }
    std::println("Connected to MCP server: {}", *name);
    std::println("");

    bool ok = run_command(client, config, opts, command, args);
    client.stop();

    if (command == "demo") std::println("Done.");
    return ok ? 0 : 1;
}
