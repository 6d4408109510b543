#include "dependency_graph.hpp"
#include <spdlog/spdlog.h>

namespace codescope {

const DependencyNode* DependencyGraph::find(const std::string& key) const {
    auto it = nodes_.find(key);
    return it == nodes_.end() ? nullptr : &it->second;
}

size_t DependencyGraph::edge_count() const {
    size_t total = 0;
    for (const auto& [key, node] : nodes_) total += node.depends_on.size();
    return total;
}

DependencyNode& DependencyGraph::ensure_node(const Symbol& symbol) {
    std::string key = make_symbol_key(symbol.file_path, symbol.name);
    auto it = nodes_.find(key);
    if (it != nodes_.end()) return it->second;

    DependencyNode node;
    node.key = key;
    node.symbol = symbol.name;
    node.file_path = symbol.file_path;
    node.kind = symbol.kind;
    node.line_number = symbol.line_number;
    return nodes_.emplace(key, std::move(node)).first->second;
}

bool DependencyGraph::add_edge(const std::string& from, const std::string& to) {
    if (from == to) return false;
    auto src = nodes_.find(from);
    auto dst = nodes_.find(to);
    if (src == nodes_.end() || dst == nodes_.end()) return false;

    src->second.depends_on.insert(to);
    dst->second.depended_by.insert(from);
    return true;
}

void DependencyGraph::remove_edge(const std::string& from, const std::string& to) {
    auto src = nodes_.find(from);
    if (src != nodes_.end()) src->second.depends_on.erase(to);
    auto dst = nodes_.find(to);
    if (dst != nodes_.end()) dst->second.depended_by.erase(from);
}

void DependencyGraph::clear_outgoing(const std::string& key) {
    auto it = nodes_.find(key);
    if (it == nodes_.end()) return;

    for (const auto& target : it->second.depends_on) {
        auto dst = nodes_.find(target);
        if (dst != nodes_.end()) dst->second.depended_by.erase(key);
    }
    it->second.depends_on.clear();
    it->second.unresolved.clear();
    it->second.is_external = false;
}

void DependencyGraph::remove_node(const std::string& key) {
    auto it = nodes_.find(key);
    if (it == nodes_.end()) return;

    clear_outgoing(key);
    for (const auto& source : it->second.depended_by) {
        auto src = nodes_.find(source);
        if (src != nodes_.end()) src->second.depends_on.erase(key);
    }
    nodes_.erase(it);
}

bool DependencyGraph::is_symmetric() const {
    for (const auto& [key, node] : nodes_) {
        for (const auto& target : node.depends_on) {
            auto dst = nodes_.find(target);
            if (dst == nodes_.end() || !dst->second.depended_by.count(key)) return false;
        }
        for (const auto& source : node.depended_by) {
            auto src = nodes_.find(source);
            if (src == nodes_.end() || !src->second.depends_on.count(key)) return false;
        }
    }
    return true;
}

NameResolver::NameResolver(const SymbolIndex& index) {
    index.for_each_symbol([this](const Symbol& symbol) {
        if (!symbol.is_graph_node()) return;
        first_match_.emplace(symbol.name, make_symbol_key(symbol.file_path, symbol.name));
    });
}

const std::string* NameResolver::resolve(const std::string& name) const {
    auto it = first_match_.find(name);
    return it == first_match_.end() ? nullptr : &it->second;
}

void DependencyGraphBuilder::add_nodes(DependencyGraph& graph, const std::vector<Symbol>& symbols) {
    for (const auto& symbol : symbols) {
        if (symbol.is_graph_node()) graph.ensure_node(symbol);
    }
}

void DependencyGraphBuilder::resolve_edges(DependencyGraph& graph, const NameResolver& resolver,
                                           const std::vector<Symbol>& symbols,
                                           const std::set<std::string>* only_keys) {
    for (const auto& symbol : symbols) {
        if (!symbol.is_graph_node()) continue;
        std::string key = make_symbol_key(symbol.file_path, symbol.name);
        if (only_keys && !only_keys->count(key)) continue;

        for (const auto& called : symbol.call_dependencies) {
            const std::string* target = resolver.resolve(called);
            if (!target) {
                // Unknown name: the edge is dropped, nothing is invented for it
                auto& node = graph.ensure_node(symbol);
                node.unresolved.insert(called);
                node.is_external = true;
                continue;
            }
            graph.add_edge(key, *target);
        }
    }
}

DependencyGraph DependencyGraphBuilder::build(const SymbolIndex& index) {
    DependencyGraph graph;
    for (const auto& file : index.files()) add_nodes(graph, index.symbols_of(file));

    NameResolver resolver(index);
    for (const auto& file : index.files()) resolve_edges(graph, resolver, index.symbols_of(file), nullptr);

    spdlog::debug("Dependency graph built: {} nodes, {} edges", graph.node_count(), graph.edge_count());
    return graph;
}

DependencyGraph DependencyGraphBuilder::rebuild(const DependencyGraph& previous,
                                                const SymbolIndex& previous_index,
                                                const SymbolIndex& index,
                                                const std::set<std::string>& changed_files) {
    if (changed_files.empty()) return previous;

    // Names whose resolution may have moved
    std::set<std::string> affected_names;
    for (const auto& file : changed_files) {
        for (const auto& s : previous_index.symbols_of(file)) {
            if (s.is_graph_node()) affected_names.insert(s.name);
        }
        for (const auto& s : index.symbols_of(file)) {
            if (s.is_graph_node()) affected_names.insert(s.name);
        }
    }

    // Sources in unchanged files that call one of those names
    std::set<std::string> dirty_keys;
    for (const auto& file : index.files()) {
        if (changed_files.count(file)) continue;
        for (const auto& s : index.symbols_of(file)) {
            if (!s.is_graph_node()) continue;
            for (const auto& called : s.call_dependencies) {
                if (affected_names.count(called)) {
                    dirty_keys.insert(make_symbol_key(s.file_path, s.name));
                    break;
                }
            }
        }
    }

    DependencyGraph graph = previous;

    std::vector<std::string> stale;
    for (const auto& [key, node] : graph.nodes()) {
        if (changed_files.count(node.file_path)) stale.push_back(key);
    }
    for (const auto& key : stale) graph.remove_node(key);
    for (const auto& key : dirty_keys) graph.clear_outgoing(key);

    for (const auto& file : changed_files) add_nodes(graph, index.symbols_of(file));

    NameResolver resolver(index);
    for (const auto& file : changed_files) resolve_edges(graph, resolver, index.symbols_of(file), nullptr);

    std::set<std::string> dirty_files;
    for (const auto& key : dirty_keys) {
        if (const auto* node = graph.find(key)) dirty_files.insert(node->file_path);
    }
    for (const auto& file : dirty_files) resolve_edges(graph, resolver, index.symbols_of(file), &dirty_keys);

    spdlog::debug("Dependency graph re-spliced: {} changed files, {} dependent sources, {} nodes",
                  changed_files.size(), dirty_keys.size(), graph.node_count());
    return graph;
}

} // namespace codescope
