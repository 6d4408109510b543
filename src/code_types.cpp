#include "code_types.hpp"

namespace codescope {

using json = nlohmann::json;

std::string symbol_kind_str(SymbolKind kind) {
    switch (kind) {
        case SymbolKind::Function: return "function";
        case SymbolKind::Class: return "class";
        case SymbolKind::Import: return "import";
    }
    return "function";
}

std::string match_type_str(MatchType type) {
    switch (type) {
        case MatchType::Exact: return "exact";
        case MatchType::Semantic: return "semantic";
        case MatchType::Pattern: return "pattern";
        case MatchType::Fuzzy: return "fuzzy";
    }
    return "semantic";
}

std::string query_status_str(QueryStatus status) {
    switch (status) {
        case QueryStatus::Ok: return "ok";
        case QueryStatus::NotFound: return "not_found";
        case QueryStatus::IndexNotBuilt: return "index_not_built";
    }
    return "ok";
}

nlohmann::json status_error_json(QueryStatus status) {
    std::string error = status == QueryStatus::IndexNotBuilt ? "Index not built" : "Symbol not found";
    return nlohmann::json{{"success", false}, {"status", query_status_str(status)}, {"error", error}};
}

std::string make_symbol_key(const std::string& file_path, const std::string& name) {
    return file_path + "::" + name;
}

json Symbol::to_json() const {
    return json{
        {"symbol", name},
        {"type", symbol_kind_str(kind)},
        {"file_path", file_path},
        {"line_number", line_number},
        {"definition", definition},
        {"docstring", docstring ? json(*docstring) : json(nullptr)},
        {"dependencies", call_dependencies}
    };
}

bool operator==(const Symbol& a, const Symbol& b) {
    return a.name == b.name && a.kind == b.kind && a.file_path == b.file_path &&
           a.line_number == b.line_number && a.definition == b.definition &&
           a.docstring == b.docstring && a.call_dependencies == b.call_dependencies;
}

json DependencyNode::to_json() const {
    return json{
        {"key", key},
        {"symbol", symbol},
        {"file_path", file_path},
        {"type", symbol_kind_str(kind)},
        {"line_number", line_number},
        {"depends_on", depends_on},
        {"depended_by", depended_by},
        {"unresolved", unresolved},
        {"is_external", is_external}
    };
}

bool operator==(const DependencyNode& a, const DependencyNode& b) {
    return a.key == b.key && a.symbol == b.symbol && a.file_path == b.file_path &&
           a.kind == b.kind && a.line_number == b.line_number &&
           a.depends_on == b.depends_on && a.depended_by == b.depended_by &&
           a.unresolved == b.unresolved && a.is_external == b.is_external;
}

json SearchResult::to_json() const {
    return json{
        {"file_path", file_path},
        {"line_number", line_number},
        {"line_content", matched_text},
        {"context_before", context_before},
        {"context_after", context_after},
        {"relevance_score", relevance_score},
        {"match_type", match_type_str(match_type)}
    };
}

} // namespace codescope
