#pragma once
#include <string>
#include <vector>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "text_utils.hpp"

namespace sdp_assistant {

// Per-request model settings, every field optional
struct ModelConfig {
    std::string api_key;
    std::string base_url;
    std::string model;
};

// Fully resolved settings for one Gateway call
struct ResolvedModel {
    std::string api_key;
    std::string base_url;
    std::string model;
};

class KeyManager {
public:
    inline static const std::vector<std::string> credential_env_vars = {
        "OPENAI_API_KEY",
        "SDP_API_KEY"
    };
    inline static const std::string default_base_url = "https://api.openai.com/v1";
    inline static const std::string default_model = "gpt-4o-mini";

    // Explicit value first, then the environment fallbacks in order
    static std::string resolve_api_key(const ModelConfig& cfg) {
        if (!trim(cfg.api_key).empty()) return trim(cfg.api_key);
        for (const auto& name : credential_env_vars) {
            std::string value = trim(env_or_empty(name.c_str()));
            if (!value.empty()) return value;
        }
        return "";
    }

    static ResolvedModel resolve(const ModelConfig& cfg) {
        ResolvedModel out;
        out.api_key = resolve_api_key(cfg);
        if (out.api_key.empty()) {
            spdlog::warn("🔑 No model credential in request or environment");
            throw ConfigurationError(
                "No API key configured. Provide model_config.api_key or set OPENAI_API_KEY / SDP_API_KEY.");
        }

        out.base_url = first_non_empty({cfg.base_url, env_or_empty("OPENAI_BASE_URL"), default_base_url});
        while (!out.base_url.empty() && out.base_url.back() == '/') out.base_url.pop_back();

        out.model = first_non_empty({cfg.model, env_or_empty("OPENAI_MODEL"), default_model});
        return out;
    }

private:
    static std::string env_or_empty(const char* name) {
        const char* v = std::getenv(name);
        return v ? std::string(v) : std::string();
    }

    static std::string first_non_empty(const std::vector<std::string>& candidates) {
        for (const auto& c : candidates) {
            std::string t = trim(c);
            if (!t.empty()) return t;
        }
        return "";
    }
};

} // namespace sdp_assistant
