#pragma once
#include <memory>
#include <optional>
#include <string>
#include "completion_gateway.hpp"
#include "pipeline/PipelineTypes.hpp"

namespace sdp_assistant {

class ReportBuilder {
public:
    static const char* const kSystemPrompt;
    static const char* const kAssessment;
    static const char* const kFallbackNote;
    static constexpr double kTemperature = 0.2;
    static constexpr size_t kContextExcerpt = 4000;
    static constexpr size_t kScriptExcerpt = 4000;
    static constexpr size_t kStdoutExcerpt = 4000;
    static constexpr size_t kStderrExcerpt = 2000;

    explicit ReportBuilder(std::shared_ptr<CompletionClient> client) : client_(std::move(client)) {}

    // Never throws; degrades to the local report
    std::string build_report(const std::string& request, const std::string& readable_context,
                             const std::string& script_text, const RunResult& run_result,
                             const ModelConfig& config);

    static std::string local_report(const std::string& request, const RunResult& run_result);

private:
    std::shared_ptr<CompletionClient> client_;

    // Empty when the model call failed for any reason
    std::optional<std::string> try_model_report(const std::string& request, const std::string& readable_context,
                                                const std::string& script_text, const RunResult& run_result,
                                                const ModelConfig& config);
};

} // namespace sdp_assistant
