#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sdp_assistant {

enum class RunStatus { Success, Error };

inline const char* run_status_name(RunStatus s) {
    return s == RunStatus::Success ? "success" : "error";
}

struct RunRequest {
    std::string script_text;
    std::string tool_label;
    std::string tool_command;
    int timeout_seconds = 120;
};

// Durable record of one execution attempt; written once to run_result.json
struct RunResult {
    std::string run_id;
    RunStatus status = RunStatus::Error;
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::vector<std::string> artifact_names;
    std::string summary_text;
    std::string command_line;
    std::string run_dir;

    bool succeeded() const { return status == RunStatus::Success; }

    nlohmann::json to_json() const {
        return {
            {"run_id", run_id},
            {"status", run_status_name(status)},
            {"exit_code", exit_code},
            {"stdout", stdout_text},
            {"stderr", stderr_text},
            {"artifacts", artifact_names},
            {"summary", summary_text},
            {"command", command_line},
            {"run_dir", run_dir}
        };
    }
};

} // namespace sdp_assistant
