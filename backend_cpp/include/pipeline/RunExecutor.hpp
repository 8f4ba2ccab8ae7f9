#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "pipeline/PipelineTypes.hpp"

namespace sdp_assistant {

namespace fs = std::filesystem;

struct ExecutorConfig {
    fs::path runs_root = "runs";
    std::vector<std::string> allowed_tools = {"matlab", "octave", "octave-cli"};
    int min_timeout_sec = 30;
    std::size_t max_output_bytes = 1 << 20;
};

class RunExecutor {
public:
    static constexpr const char* kScriptFile = "user_script.m";
    static constexpr const char* kWrapperFile = "run_wrapper.m";
    static constexpr const char* kReportFile = "run_report.txt";
    static constexpr const char* kResultFile = "run_result.json";

    explicit RunExecutor(ExecutorConfig config);

    // Materializes the run directory and runs the tool on the wrapper.
    // Throws ValidationError (tool not allow-listed), ToolNotFoundError, TimeoutError.
    RunResult execute(const std::string& script_text, const std::string& tool_label,
                      const std::string& tool_command, int timeout_seconds);

    RunResult execute(const RunRequest& request) {
        return execute(request.script_text, request.tool_label, request.tool_command, request.timeout_seconds);
    }

    // Checks the allow-list and resolves the executable path
    std::string resolve_tool(const std::string& tool_command) const;

    int effective_timeout(int requested_seconds) const;

    // UTC second timestamp + process-wide sequence + random suffix
    static std::string new_run_id();

    static std::string wrapper_script();

    const ExecutorConfig& config() const { return config_; }

private:
    ExecutorConfig config_;

    fs::path create_run_dir(std::string& run_id) const;
    static std::vector<std::string> list_artifacts(const fs::path& run_dir);
    static std::string compose_summary(const RunResult& result, const std::string& tool_label,
                                       const fs::path& run_dir);
};

} // namespace sdp_assistant
