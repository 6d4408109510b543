#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace codescope {

struct EngineConfig {
    std::vector<std::string> extensions = {".py", ".js", ".ts", ".jsx", ".tsx", ".java", ".go", ".rs"};
    std::vector<std::string> exclude_dirs = {"node_modules", ".git", "__pycache__", "venv", ".venv", "dist", "build"};
    std::vector<std::string> entry_points = {"main", "__init__", "constructor", "init"};
    size_t worker_threads = 4;
    long long index_time_budget_ms = 0; // 0 disables the budget
    size_t search_cache_entries = 256;
    int context_lines = 3;
    size_t max_pattern_results = 20;
    std::string host = "127.0.0.1";
    int port = 5010;
    std::string log_level = "info";

    // Missing keys keep their defaults
    static EngineConfig from_json(const nlohmann::json& j);

    // Reads the first existing file among `explicit_path` (when given), ./config.json
    // and ../config.json. A missing or corrupt file yields the defaults.
    static EngineConfig load(const std::string& explicit_path = "");

    nlohmann::json to_json() const;
};

} // namespace codescope
