#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <filesystem>

#include "AppConfig.hpp"
#include "LogManager.hpp"
#include "completion_gateway.hpp"
#include "request_dispatcher.hpp"
#include "pipeline/RunExecutor.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

class AssistantServer {
public:
    explicit AssistantServer(const sdp_assistant::AppConfig& config)
        : config_(config),
          server_()
    {
        sdp_assistant::ExecutorConfig exec_cfg;
        exec_cfg.runs_root = fs::absolute(config_.runs_root);
        exec_cfg.allowed_tools = config_.allowed_tools;
        exec_cfg.min_timeout_sec = config_.min_timeout_sec;

        auto gateway = std::make_shared<sdp_assistant::CompletionGateway>();
        auto executor = std::make_shared<sdp_assistant::RunExecutor>(exec_cfg);
        dispatcher_ = std::make_shared<sdp_assistant::RequestDispatcher>(
            gateway, executor,
            sdp_assistant::WorkflowDefaults{config_.tool_cmd, config_.tool_label, config_.default_timeout_sec});

        // One worker per in-flight request
        int workers = config_.worker_threads > 0 ? config_.worker_threads : 8;
        server_.new_task_queue = [workers] { return new httplib::ThreadPool(static_cast<size_t>(workers)); };
        // Base64 .slx uploads
        server_.set_payload_max_length(256 * 1024 * 1024);

        setup_routes();
    }

    bool run() {
        spdlog::info("🚀 Starting SDP Assistant Backend on {}:{} (runs: {})",
                     config_.host, config_.port, fs::absolute(config_.runs_root).string());
        return server_.listen(config_.host, config_.port);
    }

private:
    sdp_assistant::AppConfig config_;
    httplib::Server server_;
    std::shared_ptr<sdp_assistant::RequestDispatcher> dispatcher_;

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
            json response = {
                {"ok", true},
                {"service", "sdp-assistant"},
                {"runs_root", fs::absolute(config_.runs_root).string()}
            };
            res.set_content(response.dump(), "application/json");
        });

        server_.Get("/api/admin/logs", [](const httplib::Request&, httplib::Response& res) {
            json response = {{"ok", true}, {"logs", sdp_assistant::LogManager::instance().get_logs_json()}};
            res.set_content(response.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
        });

        for (const std::string op : {"convert", "ask", "workflow"}) {
            server_.Post("/api/" + op, [this, op](const httplib::Request& req, httplib::Response& res) {
                this->dispatch(op, req, res);
            });
        }

        // Routes outside the dispatcher (health, logs) report failures in the same envelope
        server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr) {
            spdlog::error("💥 Unhandled error on {}", req.path);
            res.status = 500;
            res.set_content(json{{"ok", false}, {"error", "Internal server error"}, {"error_type", "internal_error"}}.dump(),
                            "application/json");
        });
    }

    void dispatch(const std::string& op, const httplib::Request& req, httplib::Response& res) {
        auto result = dispatcher_->handle(op, req.body);
        res.status = result.status;
        // Tool output and archive text may carry invalid UTF-8
        res.set_content(result.body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
    }
};

int main() {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    auto config = sdp_assistant::AppConfig::load();
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    AssistantServer server(config);
    if (!server.run()) {
        spdlog::critical("❌ Could not bind {}:{}", config.host, config.port);
        return 1;
    }
    return 0;
}
