#include "pipeline/ReportBuilder.hpp"
#include "text_utils.hpp"
#include <spdlog/spdlog.h>

namespace sdp_assistant {

const char* const ReportBuilder::kSystemPrompt =
    "You are a senior simulation engineer reviewing an automated MATLAB/Simulink run.\n"
    "Write a concise structured report with exactly these sections:\n"
    "Outcome\nKey Findings\nRisks\nRecommended Next Iteration\n"
    "Base every statement on the provided logs and summary. Say so when the evidence is insufficient.";

const char* const ReportBuilder::kAssessment =
    "The run did not produce an automated assessment. Review the stdout/stderr logs above and the "
    "artifacts in the run directory before the next iteration.";

const char* const ReportBuilder::kFallbackNote =
    "Note: automated report generation failed; manual review is required.";

namespace {

std::string or_placeholder(const std::string& s) {
    return trim(s).empty() ? std::string("(empty)") : s;
}

} // namespace

std::string ReportBuilder::local_report(const std::string& request, const RunResult& run_result) {
    std::string out;
    out += "Workflow Report\n";
    out += "Status: " + std::string(run_status_name(run_result.status)) + "\n\n";
    out += "Prompt:\n" + or_placeholder(request) + "\n\n";
    out += "Execution summary:\n" + or_placeholder(run_result.summary_text) + "\n\n";
    out += "Stdout:\n" + or_placeholder(run_result.stdout_text) + "\n\n";
    out += "Stderr:\n" + or_placeholder(run_result.stderr_text) + "\n\n";
    out += "Assessment:\n" + std::string(kAssessment);
    return out;
}

std::optional<std::string> ReportBuilder::try_model_report(const std::string& request,
                                                           const std::string& readable_context,
                                                           const std::string& script_text,
                                                           const RunResult& run_result,
                                                           const ModelConfig& config) {
    try {
        std::string user_prompt =
            "### USER REQUEST\n" + request + "\n\n"
            "### MODEL SUMMARY (excerpt)\n" + utf8_safe_substr(readable_context, kContextExcerpt) + "\n\n"
            "### GENERATED SCRIPT (excerpt)\n" + utf8_safe_substr(script_text, kScriptExcerpt) + "\n\n"
            "### RUN SUMMARY\n" + run_result.summary_text + "\n\n"
            "### STDOUT (excerpt)\n" + utf8_safe_substr(run_result.stdout_text, kStdoutExcerpt) + "\n\n"
            "### STDERR (excerpt)\n" + utf8_safe_substr(run_result.stderr_text, kStderrExcerpt) + "\n";

        return client_->complete(kSystemPrompt, user_prompt, config, kTemperature);
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Report generation failed for run {}: {}", run_result.run_id, e.what());
        return std::nullopt;
    }
}

std::string ReportBuilder::build_report(const std::string& request, const std::string& readable_context,
                                        const std::string& script_text, const RunResult& run_result,
                                        const ModelConfig& config) {
    if (!run_result.succeeded()) {
        spdlog::info("📋 Run {} failed (exit {}), using local report", run_result.run_id, run_result.exit_code);
        return local_report(request, run_result);
    }

    auto report = try_model_report(request, readable_context, script_text, run_result, config);
    if (report) return *report;
    return local_report(request, run_result) + "\n\n" + kFallbackNote;
}

} // namespace sdp_assistant
