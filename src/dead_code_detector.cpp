#include "dead_code_detector.hpp"

namespace codescope {

using json = nlohmann::json;

json DeadCodeEntry::to_json() const {
    return json{
        {"symbol", symbol},
        {"type", symbol_kind_str(kind)},
        {"file_path", file_path},
        {"line_number", line_number},
        {"reason", reason}
    };
}

json DeadCodeResponse::to_json() const {
    if (status != QueryStatus::Ok) return status_error_json(status);

    json items = json::array();
    for (const auto& e : entries) items.push_back(e.to_json());
    return json{
        {"success", true},
        {"status", query_status_str(status)},
        {"dead_code", items},
        {"total_found", entries.size()}
    };
}

bool DeadCodeDetector::is_exempt(const std::string& name) const {
    return name.empty() || name[0] == '_' || entry_points_.count(name) > 0;
}

DeadCodeResponse DeadCodeDetector::find_dead_code(const IndexSnapshot& snapshot, const std::string& scope) const {
    DeadCodeResponse response;
    std::string normalized_scope = snapshot.normalize_scope(scope);

    for (const auto& file : snapshot.index().files()) {
        if (!IndexSnapshot::in_scope(file, normalized_scope)) continue;

        for (const auto& symbol : snapshot.index().symbols_of(file)) {
            if (!symbol.is_graph_node() || is_exempt(symbol.name)) continue;

            const auto* node = snapshot.graph().find(make_symbol_key(file, symbol.name));
            if (!node || !node->depended_by.empty()) continue;

            response.entries.push_back({symbol.name, symbol.kind, file, symbol.line_number, "No references found"});
        }
    }
    return response;
}

} // namespace codescope
