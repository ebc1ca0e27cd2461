#include "config.hpp"

#include <filesystem>
#include <fstream>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::optional<json> load_settings(const std::string& primary, const std::string& fallback) {
    std::string path;
    std::error_code ec;
    for (const auto& candidate : {primary, fallback}) {
        if (!candidate.empty() && fs::exists(candidate, ec)) {
            path = candidate;
            break;
        }
    }

    if (path.empty()) {
        std::println(stderr, "No configuration files found. Will use hardcoded values.");
        return std::nullopt;
    }

    std::println(stderr, "Reading settings from {}", path);
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}", path);
        return std::nullopt;
    }

    try {
        auto j = json::parse(f);
        if (!j.is_object()) {
            std::println(stderr, "config: {} does not contain a JSON object", path);
            return std::nullopt;
        }
        std::println(stderr, "Settings loaded successfully");
        return j;
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error in {}: {}", path, e.what());
        return std::nullopt;
    }
}

Config Config::from_json(const json& settings) {
    Config cfg;
    if (!settings.is_object() || !settings.contains("client")) return cfg;

    try {
        auto& c = settings["client"];

        if (c.contains("server")) {
            auto& s = c["server"];
            if (s.contains("command")) cfg.server.command = s["command"].get<std::string>();
            if (s.contains("args")) cfg.server.args = s["args"].get<std::vector<std::string>>();
        }

        if (c.contains("rpc")) {
            auto& r = c["rpc"];
            if (r.contains("timeout_ms")) cfg.rpc.timeout_ms = r["timeout_ms"].get<int>();
        }

        if (c.contains("demo")) {
            auto& d = c["demo"];
            if (d.contains("auth_method")) cfg.demo.auth_method = d["auth_method"].get<std::string>();
            if (d.contains("max_files")) cfg.demo.max_files = d["max_files"].get<int>();
        }

        if (c.contains("verbose")) cfg.verbose = c["verbose"].get<bool>();

    } catch (const json::exception& e) {
        std::println(stderr, "config: invalid client settings: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load(const std::string& primary, const std::string& fallback) {
    auto settings = load_settings(primary, fallback);
    if (!settings) return Config{};
    return from_json(*settings);
}
