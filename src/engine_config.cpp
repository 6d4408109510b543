#include "engine_config.hpp"
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace codescope {

namespace fs = std::filesystem;
using json = nlohmann::json;

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig cfg;
    cfg.extensions = j.value("extensions", cfg.extensions);
    cfg.exclude_dirs = j.value("exclude_dirs", cfg.exclude_dirs);
    cfg.entry_points = j.value("entry_points", cfg.entry_points);
    cfg.worker_threads = j.value("worker_threads", cfg.worker_threads);
    cfg.index_time_budget_ms = j.value("index_time_budget_ms", cfg.index_time_budget_ms);
    cfg.search_cache_entries = j.value("search_cache_entries", cfg.search_cache_entries);
    cfg.context_lines = j.value("context_lines", cfg.context_lines);
    cfg.max_pattern_results = j.value("max_pattern_results", cfg.max_pattern_results);
    cfg.host = j.value("host", cfg.host);
    cfg.port = j.value("port", cfg.port);
    cfg.log_level = j.value("log_level", cfg.log_level);

    if (cfg.worker_threads == 0) cfg.worker_threads = 1;
    if (cfg.search_cache_entries == 0) cfg.search_cache_entries = 1;
    if (cfg.context_lines < 0) cfg.context_lines = 0;
    return cfg;
}

EngineConfig EngineConfig::load(const std::string& explicit_path) {
    std::vector<std::string> search_paths;
    if (!explicit_path.empty()) search_paths.push_back(explicit_path);
    search_paths.push_back("config.json");
    search_paths.push_back("../config.json");

    for (const auto& path : search_paths) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) continue;

        try {
            std::ifstream f(path);
            auto j = json::parse(f);
            spdlog::info("⚙️  Config loaded from {}", path);
            return from_json(j);
        } catch (const std::exception& e) {
            spdlog::error("❌ Config corrupted at {}: {}", path, e.what());
            return EngineConfig{};
        }
    }

    if (!explicit_path.empty()) {
        spdlog::warn("⚠️ Config {} not found, using defaults", explicit_path);
    }
    return EngineConfig{};
}

json EngineConfig::to_json() const {
    return json{
        {"extensions", extensions},
        {"exclude_dirs", exclude_dirs},
        {"entry_points", entry_points},
        {"worker_threads", worker_threads},
        {"index_time_budget_ms", index_time_budget_ms},
        {"search_cache_entries", search_cache_entries},
        {"context_lines", context_lines},
        {"max_pattern_results", max_pattern_results},
        {"host", host},
        {"port", port},
        {"log_level", log_level}
    };
}

} // namespace codescope
