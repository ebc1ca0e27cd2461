#pragma once

#include "platform/server_process.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

inline constexpr const char* kLocalSettingsPath = "./appsettings.local.json";
inline constexpr const char* kDefaultSettingsPath = "./appsettings.json";

// Parsed JSON object from the first of primary/fallback that exists, or
// nullopt when neither does. An empty path is skipped. Only the chosen file
// is opened; a file that fails to parse is reported and counts as missing.
std::optional<nlohmann::json> load_settings(const std::string& primary = kLocalSettingsPath,
                                            const std::string& fallback = kDefaultSettingsPath);

struct Config {
    struct Server {
        std::string command = "dotnet";
        std::vector<std::string> args = {
            "run", "--project",
            "src/Ews.Code.Analyzer/Ews.Analyzer.McpService/Ews.Analyzer.McpService.csproj",
            "--no-build",
        };

        ServerCommand to_command() const { return {command, args}; }
    } server;

    struct Rpc {
        int timeout_ms = -1; // wait forever
    } rpc;

    struct Demo {
        std::string auth_method = "clientCredential";
        int max_files = 500;
    } demo;

    bool verbose = false;

    // Reads the "client" section; absent keys keep their defaults.
    static Config from_json(const nlohmann::json& settings);

    static Config load(const std::string& primary = kLocalSettingsPath,
                       const std::string& fallback = kDefaultSettingsPath);
};
