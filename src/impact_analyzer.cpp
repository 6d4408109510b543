#include "impact_analyzer.hpp"
#include <deque>
#include <set>
#include <unordered_set>

namespace codescope {

using json = nlohmann::json;

json DependencyReport::to_json() const {
    if (status != QueryStatus::Ok) return status_error_json(status);
    return json{
        {"success", true},
        {"status", query_status_str(status)},
        {"symbol", symbol},
        {"key", key},
        {"file_path", file_path},
        {"depends_on", depends_on},
        {"depended_by", depended_by},
        {"unresolved", unresolved},
        {"dependency_count", depends_on.size()},
        {"dependent_count", depended_by.size()}
    };
}

json ImpactReport::to_json() const {
    if (status != QueryStatus::Ok) return status_error_json(status);
    return json{
        {"success", true},
        {"status", query_status_str(status)},
        {"symbol", symbol},
        {"key", key},
        {"affected_symbols", affected_symbols},
        {"affected_files", affected_files},
        {"impact_score", impact_score},
        {"warning", affected_symbols.empty() ? "No dependencies found"
                                             : "Changing this symbol will affect the listed symbols"}
    };
}

DependencyReport ImpactAnalyzer::dependencies_of(const DependencyGraph& graph, const std::string& key) {
    DependencyReport report;
    const auto* node = graph.find(key);
    if (!node) {
        report.status = QueryStatus::NotFound;
        return report;
    }

    report.symbol = node->symbol;
    report.key = node->key;
    report.file_path = node->file_path;
    report.depends_on.assign(node->depends_on.begin(), node->depends_on.end());
    report.depended_by.assign(node->depended_by.begin(), node->depended_by.end());
    report.unresolved.assign(node->unresolved.begin(), node->unresolved.end());
    return report;
}

ImpactReport ImpactAnalyzer::impact_of(const DependencyGraph& graph, const std::string& key) {
    ImpactReport report;
    const auto* origin = graph.find(key);
    if (!origin) {
        report.status = QueryStatus::NotFound;
        return report;
    }

    report.symbol = origin->symbol;
    report.key = origin->key;

    std::unordered_set<std::string> visited{key};
    std::deque<const DependencyNode*> queue{origin};
    std::set<std::string> files;

    while (!queue.empty()) {
        const DependencyNode* current = queue.front();
        queue.pop_front();

        for (const auto& dependent : current->depended_by) {
            if (!visited.insert(dependent).second) continue;

            const auto* node = graph.find(dependent);
            if (!node) continue;

            report.affected_symbols.push_back(dependent);
            files.insert(node->file_path);
            queue.push_back(node);
        }
    }

    report.affected_files.assign(files.begin(), files.end());
    report.impact_score = report.affected_symbols.size();
    return report;
}

} // namespace codescope
