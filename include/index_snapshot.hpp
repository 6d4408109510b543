#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "code_types.hpp"
#include "dependency_graph.hpp"
#include "lru_cache.hpp"
#include "symbol_index.hpp"

namespace codescope {

namespace fs = std::filesystem;

struct IndexRequest {
    std::string root;
    std::vector<std::string> extensions;   // empty: configured defaults
    std::vector<std::string> exclude_dirs; // empty: configured defaults
    long long time_budget_ms = -1;         // negative: configured index_time_budget_ms
};

// A symbol that passed the relevance threshold, before file context is attached
struct SemanticHit {
    Symbol symbol;
    double score = 0.0;
    MatchType match_type = MatchType::Semantic;
};

using SemanticHitList = std::vector<SemanticHit>;
using SearchCache = LRUCache<std::string, std::shared_ptr<const SemanticHitList>>;

// One fully built generation of index + graph. Never mutated after publication;
// the search cache is the only interior state and lives and dies with the snapshot.
class IndexSnapshot {
public:
    IndexSnapshot(uint64_t generation, fs::path root, IndexRequest request,
                  SymbolIndex index, DependencyGraph graph, size_t cache_entries);

    IndexSnapshot(const IndexSnapshot&) = delete;
    IndexSnapshot& operator=(const IndexSnapshot&) = delete;

    uint64_t generation() const { return generation_; }
    const fs::path& root() const { return root_; }
    const IndexRequest& request() const { return request_; }
    const SymbolIndex& index() const { return index_; }
    const DependencyGraph& graph() const { return graph_; }
    SearchCache& search_cache() const { return *search_cache_; }
    std::chrono::system_clock::time_point built_at() const { return built_at_; }

    // Every symbol with this exact name, in index order
    const std::vector<const Symbol*>& definitions_of(const std::string& name) const;

    // Absolute or root-relative path -> the relative key files are indexed under
    std::string to_file_key(const std::string& path) const;

    // "" means the whole tree. Matching is per path component.
    std::string normalize_scope(const std::string& scope) const;
    static bool in_scope(const std::string& file_path, const std::string& normalized_scope);

    fs::path absolute_path(const std::string& file_key) const { return root_ / file_key; }

private:
    uint64_t generation_;
    fs::path root_;
    IndexRequest request_;
    SymbolIndex index_;
    DependencyGraph graph_;
    std::unordered_map<std::string, std::vector<const Symbol*>> definitions_;
    std::unique_ptr<SearchCache> search_cache_;
    std::chrono::system_clock::time_point built_at_;
};

} // namespace codescope
