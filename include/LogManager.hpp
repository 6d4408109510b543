#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace codescope {

struct QueryTrace {
    long long timestamp = 0;
    std::string operation;
    std::string detail;      // query text, symbol name, root ...
    std::string status;
    size_t result_count = 0;
    double duration_ms = 0.0;
};

class LogManager {
public:
    static constexpr size_t kMaxTraces = 50;

    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_trace(const QueryTrace& trace) {
        std::lock_guard<std::mutex> lock(mtx_);
        traces_.push_back(trace);
        if (traces_.size() > kMaxTraces) {
            traces_.pop_front();
        }
    }

    // Newest first
    nlohmann::json get_logs_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        for (auto it = traces_.rbegin(); it != traces_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"operation", it->operation},
                {"detail", it->detail},
                {"status", it->status},
                {"result_count", it->result_count},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mtx_);
        return traces_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        traces_.clear();
    }

    static long long now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

private:
    LogManager() {}
    std::deque<QueryTrace> traces_;
    std::mutex mtx_;
};

} // namespace codescope
