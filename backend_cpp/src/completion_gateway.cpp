#include "completion_gateway.hpp"
#include "errors.hpp"
#include "text_utils.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <chrono>

namespace sdp_assistant {

using json = nlohmann::json;

json CompletionGateway::build_payload(const CompletionRequest& request, const std::string& model) {
    return json{
        {"model", model},
        {"temperature", request.temperature},
        {"messages", json::array({
            {{"role", "system"}, {"content", request.system_prompt}},
            {{"role", "user"}, {"content", request.user_prompt}}
        })}
    };
}

std::string CompletionGateway::extract_text(const json& response) {
    if (!response.is_object() || !response.contains("choices") || !response["choices"].is_array() ||
        response["choices"].empty()) {
        throw EmptyResponseError("Model response contained no choices.");
    }

    const json& first = response["choices"][0];
    const json message = first.is_object() ? first.value("message", json::object()) : json::object();
    const json content = message.is_object() ? message.value("content", json()) : json();

    std::string text;
    if (content.is_string()) {
        text = content.get<std::string>();
    } else if (content.is_array()) {
        // Multi-part content: [{"type":"text","text":"..."}, ...]
        for (const auto& part : content) {
            if (part.is_string()) {
                text += part.get<std::string>();
            } else if (part.is_object() && part.contains("text") && part["text"].is_string()) {
                text += part["text"].get<std::string>();
            }
        }
    }

    text = trim(text);
    if (text.empty()) throw EmptyResponseError("Model returned an empty response.");
    return text;
}

std::string CompletionGateway::complete(const CompletionRequest& request, const ModelConfig& config) {
    ResolvedModel model = KeyManager::resolve(config);
    const std::string url = model.base_url + "/chat/completions";

    // json::dump would throw on invalid UTF-8 coming from archive text
    std::string body = build_payload(request, model.model).dump(-1, ' ', false, json::error_handler_t::replace);

    spdlog::info("🚀 Calling {} (model {}, {} prompt chars)", url, model.model,
                 request.system_prompt.size() + request.user_prompt.size());
    auto start = std::chrono::high_resolution_clock::now();

    cpr::Response r = cpr::Post(cpr::Url{url},
                                cpr::Header{{"Content-Type", "application/json"},
                                            {"Authorization", "Bearer " + model.api_key}},
                                cpr::Body{body},
                                cpr::Timeout{kTimeoutMs});

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();

    if (r.error) {
        spdlog::error("❌ Model transport failure after {:.0f} ms: {}", duration, r.error.message);
        throw UpstreamError("Model request failed: " + r.error.message);
    }

    if (r.status_code < 200 || r.status_code >= 300) {
        spdlog::error("❌ Model API Error [{}]: {}", r.status_code, utf8_safe_substr(r.text, 500));
        throw UpstreamError("Model API returned HTTP " + std::to_string(r.status_code) + ": " +
                                utf8_safe_substr(r.text, 300),
                            r.status_code);
    }

    json response_json;
    try {
        response_json = json::parse(r.text);
    } catch (const json::parse_error& e) {
        throw EmptyResponseError(std::string("Model response was not valid JSON: ") + e.what());
    }

    std::string text = extract_text(response_json);
    spdlog::info("✅ Model responded in {:.0f} ms ({} chars)", duration, text.size());
    return text;
}

} // namespace sdp_assistant
