#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace codescope {

enum class SymbolKind {
    Function,
    Class,
    Import
};

std::string symbol_kind_str(SymbolKind kind);

struct Symbol {
    std::string name;
    SymbolKind kind = SymbolKind::Function;
    std::string file_path;
    int line_number = 0;
    std::string definition;
    std::optional<std::string> docstring;
    std::set<std::string> call_dependencies;

    bool is_graph_node() const { return kind != SymbolKind::Import; }
    nlohmann::json to_json() const;
};

bool operator==(const Symbol& a, const Symbol& b);

// Key used for graph nodes: "<file_path>::<symbol_name>"
std::string make_symbol_key(const std::string& file_path, const std::string& name);

struct DependencyNode {
    std::string key;
    std::string symbol;
    std::string file_path;
    SymbolKind kind = SymbolKind::Function;
    int line_number = 0;
    std::set<std::string> depends_on;
    std::set<std::string> depended_by;
    // Called names that matched nothing in the index
    std::set<std::string> unresolved;
    bool is_external = false;

    nlohmann::json to_json() const;
};

bool operator==(const DependencyNode& a, const DependencyNode& b);

struct FileFingerprint {
    std::string file_path;
    std::string content_hash;
};

enum class MatchType {
    Exact,
    Semantic,
    Pattern,
    Fuzzy
};

std::string match_type_str(MatchType type);

struct SearchResult {
    std::string file_path;
    int line_number = 0;
    std::string matched_text;
    std::vector<std::string> context_before;
    std::vector<std::string> context_after;
    double relevance_score = 0.0;
    MatchType match_type = MatchType::Semantic;

    nlohmann::json to_json() const;
};

// Outcome of a query. NotFound and IndexNotBuilt are ordinary results, not errors.
enum class QueryStatus {
    Ok,
    NotFound,
    IndexNotBuilt
};

std::string query_status_str(QueryStatus status);

// {"success": false, "status": ..., "error": ...} body for a non-Ok query
nlohmann::json status_error_json(QueryStatus status);

} // namespace codescope
