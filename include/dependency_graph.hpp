#pragma once
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include "code_types.hpp"
#include "symbol_index.hpp"

namespace codescope {

// Nodes keyed by "file::symbol". Edges only ever go in as a pair:
// A.depends_on holds B exactly when B.depended_by holds A.
class DependencyGraph {
public:
    const DependencyNode* find(const std::string& key) const;
    bool contains(const std::string& key) const { return nodes_.count(key) > 0; }
    const std::map<std::string, DependencyNode>& nodes() const { return nodes_; }

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const;

    // First symbol seen for a key wins the node's line and kind
    DependencyNode& ensure_node(const Symbol& symbol);

    // Both ends must exist and differ; returns false otherwise
    bool add_edge(const std::string& from, const std::string& to);
    void remove_edge(const std::string& from, const std::string& to);
    void clear_outgoing(const std::string& key);
    void remove_node(const std::string& key);

    bool is_symmetric() const;
    bool operator==(const DependencyGraph& other) const { return nodes_ == other.nodes_; }

private:
    std::map<std::string, DependencyNode> nodes_;
};

// Bare name -> key of the first function/class with that name, in index order.
// Two same-named symbols in different files resolve to whichever file was indexed first.
class NameResolver {
public:
    explicit NameResolver(const SymbolIndex& index);
    const std::string* resolve(const std::string& name) const;

private:
    std::unordered_map<std::string, std::string> first_match_;
};

class DependencyGraphBuilder {
public:
    static DependencyGraph build(const SymbolIndex& index);

    // Re-splices only what `changed_files` can affect: their own nodes and edges, plus
    // edges from unchanged files whose called names are defined in a changed file
    // (before or after the change). `previous` must have been built from `previous_index`.
    static DependencyGraph rebuild(const DependencyGraph& previous,
                                   const SymbolIndex& previous_index,
                                   const SymbolIndex& index,
                                   const std::set<std::string>& changed_files);

private:
    static void add_nodes(DependencyGraph& graph, const std::vector<Symbol>& symbols);
    static void resolve_edges(DependencyGraph& graph, const NameResolver& resolver,
                              const std::vector<Symbol>& symbols, const std::set<std::string>* only_keys);
};

} // namespace codescope
