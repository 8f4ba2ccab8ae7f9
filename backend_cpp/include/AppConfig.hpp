#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sdp_assistant {

struct AppConfig {
    std::string host = "127.0.0.1";
    int port = 5003;
    int worker_threads = 8;
    std::string runs_root = "runs";
    std::string tool_cmd = "matlab";
    std::string tool_label = "MATLAB";
    std::vector<std::string> allowed_tools = {"matlab", "octave", "octave-cli"};
    int default_timeout_sec = 120;
    int min_timeout_sec = 30;
    std::string log_level = "info";

    // Loads settings.json from the first search path that has one, then
    // applies SDP_* environment overrides.
    static AppConfig load() {
        AppConfig cfg;

        std::vector<std::string> search_paths = {
            "settings.json",            // 1. Current Working Directory
            "../settings.json",         // 2. Parent Directory (common in build/Release)
            "build/settings.json",      // 3. Build Directory
            "Release/settings.json",    // 4. Release Directory
            "../../settings.json"       // 5. Project Root (from build/Release)
        };

        std::ifstream f;
        std::string found_path;
        for (const auto& path : search_paths) {
            f.open(path);
            if (f.is_open()) {
                found_path = path;
                break;
            }
            f.clear();
        }

        if (found_path.empty()) {
            spdlog::info("⚙️  No settings.json found, using built-in defaults");
        } else {
            try {
                cfg.apply_json(nlohmann::json::parse(f));
                spdlog::info("⚙️  Settings loaded from {}", found_path);
            } catch (const std::exception& e) {
                spdlog::error("💥 settings.json at {} is corrupted ({}), using defaults", found_path, e.what());
                cfg = AppConfig{};
            }
        }

        cfg.apply_env();
        return cfg;
    }

    void apply_json(const nlohmann::json& j) {
        host = j.value("host", host);
        port = j.value("port", port);
        worker_threads = j.value("worker_threads", worker_threads);
        runs_root = j.value("runs_root", runs_root);
        tool_cmd = j.value("tool_cmd", tool_cmd);
        tool_label = j.value("tool_label", tool_label);
        allowed_tools = j.value("allowed_tools", allowed_tools);
        default_timeout_sec = j.value("default_timeout_sec", default_timeout_sec);
        min_timeout_sec = j.value("min_timeout_sec", min_timeout_sec);
        log_level = j.value("log_level", log_level);
    }

    void apply_env() {
        if (const char* v = std::getenv("SDP_HOST")) host = v;
        if (const char* v = std::getenv("SDP_PORT")) port = env_int(v, port);
        if (const char* v = std::getenv("SDP_WORKERS")) worker_threads = env_int(v, worker_threads);
        if (const char* v = std::getenv("SDP_RUNS_ROOT")) runs_root = v;
        if (const char* v = std::getenv("SDP_TOOL_CMD")) tool_cmd = v;
        if (const char* v = std::getenv("SDP_TOOL_LABEL")) tool_label = v;
        if (const char* v = std::getenv("SDP_TIMEOUT_SEC")) default_timeout_sec = env_int(v, default_timeout_sec);
        if (const char* v = std::getenv("SDP_LOG_LEVEL")) log_level = v;
    }

private:
    static int env_int(const char* value, int fallback) {
        try {
            return std::stoi(value);
        } catch (const std::exception&) {
            spdlog::warn("⚠️ Ignoring non-numeric setting value '{}'", value);
            return fallback;
        }
    }
};

} // namespace sdp_assistant
