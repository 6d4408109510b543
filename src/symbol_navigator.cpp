#include "symbol_navigator.hpp"

namespace codescope {

using json = nlohmann::json;

json DefinitionResponse::to_json() const {
    if (status == QueryStatus::IndexNotBuilt) return status_error_json(status);

    json items = json::array();
    for (const auto& m : matches) items.push_back(m.to_json());
    return json{
        {"success", status == QueryStatus::Ok},
        {"status", query_status_str(status)},
        {"matches", items},
        {"total_found", matches.size()}
    };
}

json Reference::to_json() const {
    return json{
        {"file_path", file_path},
        {"symbol", symbol},
        {"type", symbol_kind_str(kind)},
        {"line_number", line_number},
        {"reference_type", reference_type}
    };
}

json ReferencesResponse::to_json() const {
    if (status != QueryStatus::Ok) return status_error_json(status);

    json items = json::array();
    for (const auto& r : references) items.push_back(r.to_json());
    return json{
        {"success", true},
        {"status", query_status_str(status)},
        {"key", key},
        {"references", items},
        {"total_found", references.size()}
    };
}

std::optional<std::string> SymbolNavigator::resolve_key(const IndexSnapshot& snapshot, const std::string& name,
                                                        const std::string& file_path) {
    if (!file_path.empty()) {
        std::string key = make_symbol_key(snapshot.to_file_key(file_path), name);
        if (snapshot.graph().contains(key)) return key;
        return std::nullopt;
    }

    for (const auto* symbol : snapshot.definitions_of(name)) {
        if (!symbol->is_graph_node()) continue;
        std::string key = make_symbol_key(symbol->file_path, symbol->name);
        if (snapshot.graph().contains(key)) return key;
    }
    return std::nullopt;
}

DefinitionResponse SymbolNavigator::find_definition(const IndexSnapshot& snapshot, const std::string& name) {
    DefinitionResponse response;
    for (const auto* symbol : snapshot.definitions_of(name)) response.matches.push_back(*symbol);
    if (response.matches.empty()) response.status = QueryStatus::NotFound;
    return response;
}

ReferencesResponse SymbolNavigator::find_references(const IndexSnapshot& snapshot, const std::string& name) {
    ReferencesResponse response;
    auto key = resolve_key(snapshot, name);
    if (!key) {
        response.status = QueryStatus::NotFound;
        return response;
    }

    response.key = *key;
    const auto* node = snapshot.graph().find(*key);
    for (const auto& dependent : node->depended_by) {
        const auto* source = snapshot.graph().find(dependent);
        if (!source) continue;
        Reference ref;
        ref.file_path = source->file_path;
        ref.symbol = source->symbol;
        ref.kind = source->kind;
        ref.line_number = source->line_number;
        response.references.push_back(std::move(ref));
    }
    return response;
}

} // namespace codescope
