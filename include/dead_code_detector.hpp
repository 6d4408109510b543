#pragma once
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_types.hpp"
#include "index_snapshot.hpp"

namespace codescope {

struct DeadCodeEntry {
    std::string symbol;
    SymbolKind kind = SymbolKind::Function;
    std::string file_path;
    int line_number = 0;
    std::string reason;

    nlohmann::json to_json() const;
};

struct DeadCodeResponse {
    QueryStatus status = QueryStatus::Ok;
    std::vector<DeadCodeEntry> entries;

    nlohmann::json to_json() const;
};

// Flags functions and classes nothing in the index depends on. This is a
// heuristic: symbols reached only through reflection, framework callbacks,
// dynamic dispatch the extractors cannot see, or code outside the indexed tree
// are reported as well. Private names (leading underscore) and entry points are
// never reported.
class DeadCodeDetector {
public:
    explicit DeadCodeDetector(const std::vector<std::string>& entry_points)
        : entry_points_(entry_points.begin(), entry_points.end()) {}

    DeadCodeResponse find_dead_code(const IndexSnapshot& snapshot, const std::string& scope) const;

    bool is_exempt(const std::string& name) const;

private:
    std::set<std::string> entry_points_;
};

} // namespace codescope
