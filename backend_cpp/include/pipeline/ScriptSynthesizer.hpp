#pragma once
#include <memory>
#include <string>
#include "completion_gateway.hpp"

namespace sdp_assistant {

class ScriptSynthesizer {
public:
    static const char* const kSystemPrompt;
    static constexpr double kTemperature = 0.1;

    explicit ScriptSynthesizer(std::shared_ptr<CompletionClient> client) : client_(std::move(client)) {}

    // Throws EmptyScriptError when the cleaned model output is blank
    std::string synthesize(const std::string& user_request, const std::string& readable_context,
                           const ModelConfig& config);

    // Removes a ```lang ... ``` wrapper; idempotent
    static std::string strip_code_fences(const std::string& raw);

private:
    std::shared_ptr<CompletionClient> client_;
};

} // namespace sdp_assistant
