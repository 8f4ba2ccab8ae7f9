#include "request_dispatcher.hpp"
#include "archive_summarizer.hpp"
#include "errors.hpp"
#include "LogManager.hpp"
#include "text_utils.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <spdlog/spdlog.h>

namespace sdp_assistant {

using json = nlohmann::json;

const char* const RequestDispatcher::kAskSystemPrompt =
    "You are an expert assistant for MATLAB/Simulink model review. You are given a structural summary "
    "extracted from an .slx model (systems, blocks, block types and connections) and a question about it. "
    "Answer clearly and concisely using only the provided summary. When the summary does not contain the "
    "information needed, say what is missing instead of guessing.";

namespace {

ModelConfig model_config_from(const json& body) {
    if (!body.contains("model_config") || body["model_config"].is_null()) return ModelConfig{};
    if (!body["model_config"].is_object()) throw ValidationError("model_config must be an object.");
    const json& mc = body["model_config"];
    for (const char* key : {"api_key", "base_url", "model"}) {
        if (mc.contains(key) && !mc[key].is_null() && !mc[key].is_string()) {
            throw ValidationError(std::string("model_config.") + key + " must be a string.");
        }
    }
    ModelConfig cfg;
    if (mc.contains("api_key") && mc["api_key"].is_string()) cfg.api_key = mc["api_key"].get<std::string>();
    if (mc.contains("base_url") && mc["base_url"].is_string()) cfg.base_url = mc["base_url"].get<std::string>();
    if (mc.contains("model") && mc["model"].is_string()) cfg.model = mc["model"].get<std::string>();
    return cfg;
}

std::string preview_of(const json& body) {
    if (!body.is_object()) return "";
    for (const char* key : {"prompt", "filename"}) {
        if (body.contains(key) && body[key].is_string()) {
            return utf8_safe_substr(body[key].get<std::string>(), 80);
        }
    }
    return "";
}

} // namespace

RequestDispatcher::RequestDispatcher(std::shared_ptr<CompletionClient> client,
                                     std::shared_ptr<RunExecutor> executor,
                                     WorkflowDefaults defaults)
    : client_(client),
      executor_(std::move(executor)),
      synthesizer_(client),
      report_builder_(client),
      defaults_(std::move(defaults)) {}

std::string RequestDispatcher::require_text(const json& body, const std::string& key) {
    if (!body.contains(key) || body[key].is_null()) {
        throw ValidationError("Missing required field: " + key);
    }
    if (!body[key].is_string()) throw ValidationError("Field '" + key + "' must be a string.");
    std::string value = body[key].get<std::string>();
    if (trim(value).empty()) throw ValidationError("Field '" + key + "' must not be empty.");
    return value;
}

int RequestDispatcher::http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:     return 400;
        case ErrorKind::InvalidArchive: return 400;
        case ErrorKind::Configuration:  return 500;
        case ErrorKind::Upstream:       return 502;
        case ErrorKind::EmptyResponse:  return 502;
        case ErrorKind::EmptyScript:    return 502;
        case ErrorKind::Timeout:        return 504;
        case ErrorKind::ToolNotFound:   return 500;
    }
    return 500;
}

DispatchResult RequestDispatcher::failure(const std::string& error_type, const std::string& message, int status) {
    return DispatchResult{status, json{{"ok", false}, {"error", message}, {"error_type", error_type}}};
}

json RequestDispatcher::convert(const json& body) {
    std::string filename = require_text(body, "filename");
    if (!ends_with_ci(trim(filename), ".slx")) {
        throw ValidationError("Only .slx files are supported.");
    }
    std::string content_b64 = require_text(body, "content_b64");

    std::string bytes = base64_decode(content_b64);
    if (bytes.empty()) throw ValidationError("content_b64 decoded to an empty file.");

    spdlog::info("📦 Convert request: {} ({} bytes)", filename, bytes.size());
    ArchiveSummary summary = ArchiveSummarizer::summarize(bytes, trim(filename));

    json notes = json::array();
    for (const auto& n : summary.notes) notes.push_back({{"entry", n.entry_name}, {"message", n.message}});

    return json{
        {"ok", true},
        {"readable_text", summary.readable_text},
        {"stats", summary.stats.to_json()},
        {"parse_notes", notes}
    };
}

json RequestDispatcher::ask(const json& body) {
    std::string prompt = require_text(body, "prompt");
    std::string readable = require_text(body, "readable_text");
    ModelConfig config = model_config_from(body);

    std::string user_prompt =
        "SLX readable data:\n" + readable + "\n\n"
        "User question:\n" + prompt;

    spdlog::info("💬 Ask request ({} chars of context)", readable.size());
    std::string answer = client_->complete(kAskSystemPrompt, user_prompt, config, kAskTemperature);
    return json{{"ok", true}, {"answer", answer}};
}

json RequestDispatcher::workflow(const json& body) {
    std::string prompt = require_text(body, "prompt");
    std::string readable = require_text(body, "readable_text");
    ModelConfig config = model_config_from(body);

    std::string tool_cmd = defaults_.tool_cmd;
    std::string tool_label = defaults_.tool_label;
    if (body.contains("tool_cmd") && !body["tool_cmd"].is_null()) {
        if (!body["tool_cmd"].is_string()) throw ValidationError("tool_cmd must be a string.");
        std::string override_cmd = trim(body["tool_cmd"].get<std::string>());
        if (!override_cmd.empty()) {
            tool_cmd = override_cmd;
            tool_label = fs::path(override_cmd).filename().string();
        }
    }

    int timeout = defaults_.timeout_sec;
    if (body.contains("timeout_sec") && !body["timeout_sec"].is_null()) {
        const json& t = body["timeout_sec"];
        if (!t.is_number()) throw ValidationError("timeout_sec must be a number.");
        double seconds = t.get<double>();
        if (!(seconds > 0) || seconds > kMaxTimeoutSec) {
            throw ValidationError("timeout_sec must be between 1 and " + std::to_string(kMaxTimeoutSec) + ".");
        }
        timeout = static_cast<int>(std::ceil(seconds));
    }

    // Fail fast on a bad tool before spending a model call
    executor_->resolve_tool(tool_cmd);

    spdlog::info("🛰️ Workflow request: tool={} timeout={}s", tool_cmd, timeout);
    std::string script = synthesizer_.synthesize(prompt, readable, config);
    RunResult run = executor_->execute(script, tool_label, tool_cmd, timeout);
    std::string report = report_builder_.build_report(prompt, readable, script, run, config);

    return json{
        {"ok", true},
        {"generated_script", script},
        {"run_result", run.to_json()},
        {"report", report}
    };
}

DispatchResult RequestDispatcher::handle(const std::string& operation, const std::string& raw_body) {
    auto start = std::chrono::high_resolution_clock::now();
    DispatchResult result;
    json body;
    std::string run_id;

    try {
        try {
            body = json::parse(raw_body);
        } catch (const json::parse_error&) {
            throw ValidationError("Request body must be valid JSON.");
        }
        if (!body.is_object()) throw ValidationError("Request body must be a JSON object.");

        if (operation == "convert") {
            result.body = convert(body);
        } else if (operation == "ask") {
            result.body = ask(body);
        } else if (operation == "workflow") {
            result.body = workflow(body);
            run_id = result.body["run_result"].value("run_id", "");
        } else {
            result = failure("not_found", "Unknown operation: " + operation, 404);
        }
    } catch (const PipelineError& e) {
        const char* type = error_kind_name(e.kind());
        if (e.kind() == ErrorKind::Validation) {
            spdlog::warn("⚠️ {} rejected: {}", operation, e.what());
        } else {
            spdlog::error("❌ {} failed [{}]: {}", operation, type, e.what());
        }
        result = failure(type, e.what(), http_status_for(e.kind()));
    } catch (const std::exception& e) {
        spdlog::error("💥 {} failed unexpectedly: {}", operation, e.what());
        result = failure("internal_error", e.what(), 500);
    } catch (...) {
        spdlog::error("💥 {} failed with a non-standard exception", operation);
        result = failure("internal_error", "Internal server error", 500);
    }

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();

    std::string outcome = result.body.value("ok", false) ? "ok" : result.body.value("error_type", "error");
    LogManager::instance().add_log({
        static_cast<long long>(std::time(nullptr)), operation, preview_of(body), outcome, run_id, duration
    });
    return result;
}

} // namespace sdp_assistant
