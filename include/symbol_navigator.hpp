#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_types.hpp"
#include "index_snapshot.hpp"

namespace codescope {

struct DefinitionResponse {
    QueryStatus status = QueryStatus::Ok;
    std::vector<Symbol> matches;

    nlohmann::json to_json() const;
};

struct Reference {
    std::string file_path;
    std::string symbol;
    SymbolKind kind = SymbolKind::Function;
    int line_number = 0;
    std::string reference_type = "usage";

    nlohmann::json to_json() const;
};

struct ReferencesResponse {
    QueryStatus status = QueryStatus::Ok;
    std::string key;
    std::vector<Reference> references;

    nlohmann::json to_json() const;
};

class SymbolNavigator {
public:
    // Every indexed symbol (any kind) with exactly this name, across files
    static DefinitionResponse find_definition(const IndexSnapshot& snapshot, const std::string& name);

    // Symbols whose resolved calls land on `name`
    static ReferencesResponse find_references(const IndexSnapshot& snapshot, const std::string& name);

    // Graph key for a name: "<file>::<name>" when a file is given, otherwise the
    // first function/class with that name in index order
    static std::optional<std::string> resolve_key(const IndexSnapshot& snapshot, const std::string& name,
                                                  const std::string& file_path = "");
};

} // namespace codescope
