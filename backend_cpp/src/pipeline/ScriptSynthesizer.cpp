#include "pipeline/ScriptSynthesizer.hpp"
#include "errors.hpp"
#include "text_utils.hpp"
#include <cctype>
#include <spdlog/spdlog.h>

namespace sdp_assistant {

const char* const ScriptSynthesizer::kSystemPrompt =
    "### ROLE\n"
    "You are a MATLAB/Simulink automation engineer. You write scripts that are executed unattended.\n\n"
    "### OUTPUT PROTOCOL (STRICT)\n"
    "1. Return ONLY executable MATLAB script text. No explanations, no markdown, no ``` fences.\n"
    "2. The script must be self-contained: create or load the model state it needs, set parameters, "
    "run the workflow, and store the final outcome in a variable named `result`.\n"
    "3. The script must never wait for interactive input (no input(), keyboard, pause without timeout, "
    "or GUI dialogs).\n"
    "4. Use comments inside the script for any notes.\n";

namespace {

const std::string kFence = "```";

bool is_language_tag(const std::string& s) {
    for (char c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!(std::isalnum(u) || c == '_' || c == '-' || c == '+' || c == '.')) return false;
    }
    return true;
}

// One unwrapping pass; returns the input unchanged when no fence is present
std::string strip_once(const std::string& text) {
    std::string body = text;
    bool changed = false;

    if (body.compare(0, kFence.size(), kFence) == 0) {
        auto newline = body.find('\n');
        std::string opener_rest = body.substr(kFence.size(), newline == std::string::npos ? std::string::npos
                                                                                          : newline - kFence.size());
        std::string tag = trim(opener_rest);
        if (newline == std::string::npos) {
            body = opener_rest;
        } else if (is_language_tag(tag)) {
            body = body.substr(newline + 1);
        } else {
            // Code began on the fence line itself
            body = body.substr(kFence.size());
        }
        changed = true;
    }

    std::string trimmed = trim(body);
    if (trimmed.size() >= kFence.size() &&
        trimmed.compare(trimmed.size() - kFence.size(), kFence.size(), kFence) == 0) {
        trimmed = trimmed.substr(0, trimmed.size() - kFence.size());
        changed = true;
    }

    return changed ? trim(trimmed) : trim(text);
}

} // namespace

std::string ScriptSynthesizer::strip_code_fences(const std::string& raw) {
    std::string current = trim(raw);
    while (true) {
        std::string next = strip_once(current);
        if (next == current) return current;
        current = next;
    }
}

std::string ScriptSynthesizer::synthesize(const std::string& user_request, const std::string& readable_context,
                                          const ModelConfig& config) {
    std::string user_prompt =
        "### MODEL SUMMARY\n" + readable_context + "\n\n"
        "### USER REQUEST\n" + user_request + "\n\n"
        "### SCRIPT\n";

    spdlog::info("🧠 Synthesizing script for request ({} chars)", user_request.size());
    std::string raw = client_->complete(kSystemPrompt, user_prompt, config, kTemperature);
    std::string script = strip_code_fences(raw);
    if (script.empty()) {
        throw EmptyScriptError("Model returned no executable script.");
    }
    spdlog::info("📝 Script synthesized ({} chars)", script.size());
    return script;
}

} // namespace sdp_assistant
