#pragma once
#include <string>
#include <memory>
#include <nlohmann/json.hpp>
#include "KeyManager.hpp"

namespace sdp_assistant {

struct CompletionRequest {
    std::string system_prompt;
    std::string user_prompt;
    double temperature = 0.2;
};

// Seam between the pipeline stages and the remote text-generation service
class CompletionClient {
public:
    virtual ~CompletionClient() = default;

    // Throws ConfigurationError, UpstreamError or EmptyResponseError
    virtual std::string complete(const CompletionRequest& request, const ModelConfig& config) = 0;

    std::string complete(const std::string& system_prompt, const std::string& user_prompt,
                         const ModelConfig& config, double temperature) {
        return complete(CompletionRequest{system_prompt, user_prompt, temperature}, config);
    }
};

// OpenAI-compatible /chat/completions over cpr. One attempt per call.
class CompletionGateway : public CompletionClient {
public:
    static constexpr int kTimeoutMs = 120000;

    using CompletionClient::complete;
    std::string complete(const CompletionRequest& request, const ModelConfig& config) override;

    static nlohmann::json build_payload(const CompletionRequest& request, const std::string& model);

    // choices[0].message.content, joining list-of-parts content; trimmed
    static std::string extract_text(const nlohmann::json& response);
};

} // namespace sdp_assistant
