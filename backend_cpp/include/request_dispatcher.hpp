#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "completion_gateway.hpp"
#include "pipeline/RunExecutor.hpp"
#include "pipeline/ScriptSynthesizer.hpp"
#include "pipeline/ReportBuilder.hpp"

namespace sdp_assistant {

struct DispatchResult {
    int status = 200;
    nlohmann::json body;
};

struct WorkflowDefaults {
    std::string tool_cmd = "matlab";
    std::string tool_label = "MATLAB";
    int timeout_sec = 120;
};

class RequestDispatcher {
public:
    static const char* const kAskSystemPrompt;
    static constexpr double kAskTemperature = 0.2;
    static constexpr int kMaxTimeoutSec = 3600;

    RequestDispatcher(std::shared_ptr<CompletionClient> client,
                      std::shared_ptr<RunExecutor> executor,
                      WorkflowDefaults defaults);

    // Parses `raw_body` and routes to convert/ask/workflow. Never throws.
    DispatchResult handle(const std::string& operation, const std::string& raw_body);

    // Each throws PipelineError subclasses; handle() maps them to envelopes
    nlohmann::json convert(const nlohmann::json& body);
    nlohmann::json ask(const nlohmann::json& body);
    nlohmann::json workflow(const nlohmann::json& body);

    static DispatchResult failure(const std::string& error_type, const std::string& message, int status);
    static int http_status_for(ErrorKind kind);

private:
    std::shared_ptr<CompletionClient> client_;
    std::shared_ptr<RunExecutor> executor_;
    ScriptSynthesizer synthesizer_;
    ReportBuilder report_builder_;
    WorkflowDefaults defaults_;

    static std::string require_text(const nlohmann::json& body, const std::string& key);
};

} // namespace sdp_assistant
