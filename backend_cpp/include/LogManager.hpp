#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sdp_assistant {

struct InteractionLog {
    long long timestamp;
    std::string operation;      // convert | ask | workflow
    std::string prompt_preview;
    std::string outcome;        // "ok" or an error_type
    std::string run_id;         // workflow only
    double duration_ms;
};

class LogManager {
public:
    static constexpr size_t max_entries = 50;

    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(const InteractionLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > max_entries) {
            logs_.pop_front();
        }
    }

    // Newest first
    json get_logs_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"operation", it->operation},
                {"prompt_preview", it->prompt_preview},
                {"outcome", it->outcome},
                {"run_id", it->run_id},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
    }

private:
    LogManager() {}
    std::deque<InteractionLog> logs_;
    std::mutex mtx_;
};

}
