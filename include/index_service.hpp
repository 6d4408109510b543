#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "dead_code_detector.hpp"
#include "engine_config.hpp"
#include "file_scanner.hpp"
#include "impact_analyzer.hpp"
#include "index_snapshot.hpp"
#include "language_extractor.hpp"
#include "pattern_similarity.hpp"
#include "semantic_search.hpp"
#include "symbol_navigator.hpp"

namespace codescope {

enum class EngineState {
    Empty,
    Indexing,
    Ready
};

std::string engine_state_str(EngineState state);

enum class IndexStatus {
    Ok,
    InvalidRoot,
    BudgetExceeded,
    IndexNotBuilt
};

std::string index_status_str(IndexStatus status);

struct IndexReport {
    IndexStatus status = IndexStatus::Ok;
    size_t indexed_files = 0;
    size_t total_symbols = 0;
    size_t updated_files = 0;
    size_t unchanged_files = 0;
    size_t removed_files = 0;
    size_t skipped_files = 0;
    size_t parse_errors = 0;
    double elapsed_seconds = 0.0;
    uint64_t generation = 0;
    std::string root;

    nlohmann::json to_json() const;
};

// Owns the current snapshot and every query component. Rebuilds are serialized
// behind one writer lock and published with a single pointer swap; queries grab
// the current snapshot and never block on a rebuild in progress.
class IndexService {
public:
    explicit IndexService(EngineConfig config = EngineConfig{},
                          ExtractorRegistry registry = ExtractorRegistry::with_defaults());

    IndexService(const IndexService&) = delete;
    IndexService& operator=(const IndexService&) = delete;

    // Same root as the current snapshot: only changed, new and vanished files are
    // reprocessed. Any other root: full rebuild.
    IndexReport index_codebase(const IndexRequest& request);

    // Re-fingerprints one file of the current root and splices it in (or out, when
    // the file is gone).
    IndexReport reindex_file(const std::string& path);

    SemanticSearchResponse semantic_search(const std::string& query, const std::string& scope = "",
                                           size_t max_results = 10);
    PatternSearchResponse find_similar_patterns(const std::string& snippet, const std::string& language,
                                                double threshold = 0.7);
    DependencyReport analyze_dependencies(const std::string& symbol, const std::string& file_path = "");
    ImpactReport impact_analysis(const std::string& symbol, const std::string& file_path = "");
    DeadCodeResponse detect_dead_code(const std::string& scope = "");
    DefinitionResponse find_definition(const std::string& symbol);
    ReferencesResponse find_references(const std::string& symbol);

    // Drops the current snapshot; the engine goes back to Empty
    void clear();

    EngineState state() const { return state_.load(); }
    std::shared_ptr<const IndexSnapshot> snapshot() const;
    nlohmann::json status_json() const;
    const EngineConfig& config() const { return config_; }
    const ExtractorRegistry& registry() const { return registry_; }

private:
    struct FileOutcome {
        enum class Kind { Updated, Unchanged, Skipped, Aborted };
        Kind kind = Kind::Skipped;
        std::string file_path;
        std::string content_hash;
        std::vector<Symbol> symbols;
        bool parse_error = false;
    };

    FileOutcome process_file(const fs::path& root, const fs::path& file, const SymbolIndex* base) const;
    std::vector<Symbol> extract_symbols(const ScannedFile& scanned, bool& parse_error) const;
    uint64_t publish(fs::path root, IndexRequest request, SymbolIndex index, DependencyGraph graph);

    void record_index_trace(const std::string& operation, const std::string& detail,
                            const IndexReport& report) const;
    void record_trace(const std::string& operation, const std::string& detail, QueryStatus status,
                      size_t result_count, std::chrono::steady_clock::time_point start) const;

    EngineConfig config_;
    ExtractorRegistry registry_;
    SemanticSearchEngine semantic_engine_;
    PatternSimilarityEngine pattern_engine_;
    DeadCodeDetector dead_code_detector_;

    std::mutex write_mutex_;
    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const IndexSnapshot> current_;
    std::atomic<EngineState> state_{EngineState::Empty};
    uint64_t generation_ = 0;
};

} // namespace codescope
