#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_types.hpp"
#include "dependency_graph.hpp"

namespace codescope {

struct DependencyReport {
    QueryStatus status = QueryStatus::Ok;
    std::string symbol;
    std::string key;
    std::string file_path;
    std::vector<std::string> depends_on;
    std::vector<std::string> depended_by;
    std::vector<std::string> unresolved;

    nlohmann::json to_json() const;
};

struct ImpactReport {
    QueryStatus status = QueryStatus::Ok;
    std::string symbol;
    std::string key;
    std::vector<std::string> affected_symbols; // breadth-first order
    std::vector<std::string> affected_files;   // sorted, distinct
    size_t impact_score = 0;

    nlohmann::json to_json() const;
};

class ImpactAnalyzer {
public:
    // Direct edges of one node
    static DependencyReport dependencies_of(const DependencyGraph& graph, const std::string& key);

    // Breadth-first over depended_by. Every node is visited at most once, so a cycle
    // cannot keep the walk going; the origin never counts as affected.
    static ImpactReport impact_of(const DependencyGraph& graph, const std::string& key);
};

} // namespace codescope
