#include "index_snapshot.hpp"
#include <optional>

namespace codescope {

IndexSnapshot::IndexSnapshot(uint64_t generation, fs::path root, IndexRequest request,
                             SymbolIndex index, DependencyGraph graph, size_t cache_entries)
    : generation_(generation),
      root_(std::move(root)),
      request_(std::move(request)),
      index_(std::move(index)),
      graph_(std::move(graph)),
      search_cache_(std::make_unique<SearchCache>(cache_entries)),
      built_at_(std::chrono::system_clock::now()) {
    // Secondary name -> location map for navigation lookups
    for (const auto& file : index_.files()) {
        for (const auto& symbol : index_.symbols_of(file)) {
            definitions_[symbol.name].push_back(&symbol);
        }
    }
}

const std::vector<const Symbol*>& IndexSnapshot::definitions_of(const std::string& name) const {
    static const std::vector<const Symbol*> none;
    auto it = definitions_.find(name);
    return it == definitions_.end() ? none : it->second;
}

std::string IndexSnapshot::to_file_key(const std::string& path) const {
    fs::path p(path);
    if (p.is_absolute()) {
        auto under_root = [this](const fs::path& candidate) -> std::optional<std::string> {
            auto rel = candidate.lexically_relative(root_.lexically_normal());
            if (rel.empty() || *rel.begin() == "..") return std::nullopt;
            return rel.generic_string();
        };
        if (auto key = under_root(p.lexically_normal())) return *key;

        // The caller may have spelled the root through a symlink
        std::error_code ec;
        auto resolved = fs::weakly_canonical(p, ec);
        if (!ec) {
            if (auto key = under_root(resolved)) return *key;
        }
        return p.generic_string();
    }
    return p.lexically_normal().generic_string();
}

std::string IndexSnapshot::normalize_scope(const std::string& scope) const {
    if (scope.empty()) return "";
    std::string key = to_file_key(scope);
    while (!key.empty() && key.back() == '/') key.pop_back();
    if (key == "." || key.empty()) return "";
    return key;
}

bool IndexSnapshot::in_scope(const std::string& file_path, const std::string& normalized_scope) {
    if (normalized_scope.empty()) return true;
    if (file_path == normalized_scope) return true;
    return file_path.size() > normalized_scope.size() &&
           file_path.compare(0, normalized_scope.size(), normalized_scope) == 0 &&
           file_path[normalized_scope.size()] == '/';
}

} // namespace codescope
