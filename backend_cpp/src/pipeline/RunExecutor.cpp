#include "pipeline/RunExecutor.hpp"
#include "tools/ProcessRunner.hpp"
#include "KeyManager.hpp"
#include "errors.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <random>
#include <sstream>
#include <spdlog/spdlog.h>

namespace sdp_assistant {

namespace {

const std::string kForbiddenToolChars = " \t\r\n;&|`$<>(){}[]*?!'\"\\~#";

void write_text_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot create " + path.string());
    out << content;
    out.close();
    if (!out) throw std::runtime_error("Failed writing " + path.string());
}

std::string read_text_file(const fs::path& path) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

} // namespace

RunExecutor::RunExecutor(ExecutorConfig config) : config_(std::move(config)) {}

std::string RunExecutor::new_run_id() {
    static std::atomic<unsigned long long> sequence{0};
    thread_local std::mt19937 rng(std::random_device{}());

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm_utc);

    char suffix[48];
    std::snprintf(suffix, sizeof(suffix), "_%06llu_%04x", sequence.fetch_add(1) + 1,
                  static_cast<unsigned int>(rng() & 0xFFFF));
    return std::string(stamp) + suffix;
}

std::string RunExecutor::wrapper_script() {
    return
        "% Generated wrapper: runs user_script.m and standardizes result capture.\n"
        "try\n"
        "    run('user_script.m');\n"
        "catch sdp_err\n"
        "    fprintf(2, 'SDP_WRAPPER_ERROR: %s\\n', sdp_err.message);\n"
        "    exit(1);\n"
        "end\n"
        "if exist('result', 'var')\n"
        "    save('result.mat', 'result');\n"
        "    fprintf('SDP_RESULT_SAVED\\n');\n"
        "else\n"
        "    fprintf('SDP_RESULT_MISSING\\n');\n"
        "end\n"
        "sdp_fid = fopen('run_report.txt', 'w');\n"
        "fprintf(sdp_fid, 'Workflow completed. Result variable: %d\\n', exist('result', 'var'));\n"
        "fclose(sdp_fid);\n"
        "exit(0);\n";
}

int RunExecutor::effective_timeout(int requested_seconds) const {
    return std::max(config_.min_timeout_sec, requested_seconds);
}

std::string RunExecutor::resolve_tool(const std::string& tool_command) const {
    std::string cmd = trim(tool_command);
    if (cmd.empty()) throw ValidationError("Tool command is empty.");
    if (cmd.find_first_of(kForbiddenToolChars) != std::string::npos) {
        throw ValidationError("Tool command must be a single executable name or path without arguments: " + cmd);
    }

    std::string base = fs::path(cmd).filename().string();
    if (std::find(config_.allowed_tools.begin(), config_.allowed_tools.end(), base) == config_.allowed_tools.end()) {
        throw ValidationError("Tool '" + base + "' is not in the allowed tool list (" +
                              join(config_.allowed_tools, ", ") + ").");
    }

    std::string resolved = ProcessRunner::find_executable(cmd);
    if (resolved.empty()) {
        throw ToolNotFoundError("External tool not found: " + cmd);
    }
    return resolved;
}

fs::path RunExecutor::create_run_dir(std::string& run_id) const {
    fs::create_directories(config_.runs_root);
    for (int attempt = 0; attempt < 8; ++attempt) {
        run_id = new_run_id();
        fs::path dir = config_.runs_root / run_id;
        if (fs::create_directory(dir)) return dir;
        spdlog::warn("⚠️ Run directory {} already exists, regenerating id", dir.string());
    }
    throw std::runtime_error("Could not allocate a unique run directory under " + config_.runs_root.string());
}

std::vector<std::string> RunExecutor::list_artifacts(const fs::path& run_dir) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(run_dir)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string RunExecutor::compose_summary(const RunResult& result, const std::string& tool_label,
                                         const fs::path& run_dir) {
    std::ostringstream out;
    out << "Run ID: " << result.run_id << "\n";
    out << "Tool: " << tool_label << "\n";
    out << "Command: " << result.command_line << "\n";
    out << "Exit code: " << result.exit_code << "\n";
    out << "Artifacts: " << (result.artifact_names.empty() ? "(none)" : join(result.artifact_names, ", "));

    fs::path report = run_dir / kReportFile;
    if (fs::exists(report)) {
        out << "\nRun note: " << trim(read_text_file(report));
    }
    return out.str();
}

RunResult RunExecutor::execute(const std::string& script_text, const std::string& tool_label,
                               const std::string& tool_command, int timeout_seconds) {
    const std::string executable = resolve_tool(tool_command);
    const int timeout = effective_timeout(timeout_seconds);

    RunResult result;
    fs::path run_dir = create_run_dir(result.run_id);
    result.run_dir = run_dir.string();
    result.command_line = executable + " " + kWrapperFile;

    write_text_file(run_dir / kScriptFile, script_text);
    write_text_file(run_dir / kWrapperFile, wrapper_script());

    spdlog::info("🛠️ Run {}: {} (timeout {}s)", result.run_id, result.command_line, timeout);

    ProcessSpec spec;
    spec.command = executable;
    spec.argv = {kWrapperFile};
    spec.cwd = run_dir.string();
    spec.timeout_ms = static_cast<std::uint64_t>(timeout) * 1000;
    spec.max_output_bytes = config_.max_output_bytes;
    spec.env_exclude = KeyManager::credential_env_vars;

    auto start = std::chrono::steady_clock::now();
    ProcessResult proc = ProcessRunner::run(spec);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (proc.timed_out) {
        spdlog::error("⏱️ Run {} exceeded {}s and was killed", result.run_id, timeout);
        throw TimeoutError("External tool exceeded the " + std::to_string(timeout) + "s timeout (run " +
                               result.run_id + ").",
                           timeout);
    }

    result.exit_code = proc.exit_code;
    result.status = proc.exit_code == 0 ? RunStatus::Success : RunStatus::Error;
    result.stdout_text = proc.stdout_text;
    result.stderr_text = proc.stderr_text;
    result.artifact_names = list_artifacts(run_dir);
    result.summary_text = compose_summary(result, tool_label, run_dir);

    spdlog::info("{} Run {} finished in {:.1f}s with exit code {} ({} artifacts)",
                 result.succeeded() ? "✅" : "❌", result.run_id, elapsed, result.exit_code,
                 result.artifact_names.size());

    try {
        write_text_file(run_dir / kResultFile,
                        result.to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Could not persist {} for run {}: {}", kResultFile, result.run_id, e.what());
    }
    return result;
}

} // namespace sdp_assistant
