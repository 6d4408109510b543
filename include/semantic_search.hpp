#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_types.hpp"
#include "index_snapshot.hpp"

namespace codescope {

struct SemanticSearchResponse {
    QueryStatus status = QueryStatus::Ok;
    std::vector<SearchResult> results;
    size_t total_found = 0;
    bool cached = false;

    nlohmann::json to_json() const;
};

struct FileContext {
    std::vector<std::string> before;
    std::vector<std::string> after;
};

class SemanticSearchEngine {
public:
    // Scores at or below this are dropped
    static constexpr double kRelevanceThreshold = 0.3;

    explicit SemanticSearchEngine(int context_lines = 3) : context_lines_(context_lines) {}

    // Ranked by score, then file path, then line. Scored hits are cached per
    // (query, scope) in the snapshot; file context is always read fresh from disk.
    SemanticSearchResponse search(const IndexSnapshot& snapshot, const std::string& query,
                                  const std::string& scope, size_t max_results) const;

    // Name match (exact 1.0 / substring 0.7 / any query word 0.5, first that applies)
    // plus docstring 0.4 plus definition 0.3, capped at 1.0. Case-insensitive.
    static double score(const std::string& query, const Symbol& symbol);

    static FileContext read_context(const fs::path& file, int line_number, int context_lines);

private:
    SemanticHitList rank(const IndexSnapshot& snapshot, const std::string& query,
                         const std::string& normalized_scope) const;

    int context_lines_;
};

} // namespace codescope
