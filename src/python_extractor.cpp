#include "python_extractor.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <stack>
#include <spdlog/spdlog.h>

namespace codescope {

namespace {

struct ParserDeleter {
    void operator()(TSParser* parser) const { ts_parser_delete(parser); }
};

struct TreeDeleter {
    void operator()(TSTree* tree) const { ts_tree_delete(tree); }
};

std::string node_text(TSNode node, const std::string& content) {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start >= content.size() || end <= start) return "";
    return content.substr(start, std::min<size_t>(end, content.size()) - start);
}

std::string node_type(TSNode node) {
    return ts_node_type(node);
}

int node_line(TSNode node) {
    return static_cast<int>(ts_node_start_point(node).row) + 1;
}

TSNode field(TSNode node, const char* name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::char_traits<char>::length(name)));
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string first_line(const std::string& text) {
    return trim(text.substr(0, text.find('\n')));
}

// First line and row of a syntax error, for the log message
int find_error_line(TSNode root) {
    std::stack<TSNode> stack;
    stack.push(root);
    while (!stack.empty()) {
        TSNode node = stack.top();
        stack.pop();
        if (ts_node_is_missing(node) || node_type(node) == "ERROR") return node_line(node);
        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = count; i > 0; --i) stack.push(ts_node_child(node, i - 1));
    }
    return node_line(root);
}

std::optional<std::string> extract_docstring(TSNode definition, const std::string& content) {
    TSNode body = field(definition, "body");
    if (ts_node_is_null(body) || ts_node_named_child_count(body) == 0) return std::nullopt;

    TSNode first = ts_node_named_child(body, 0);
    if (node_type(first) != "expression_statement" || ts_node_named_child_count(first) == 0) return std::nullopt;

    TSNode expr = ts_node_named_child(first, 0);
    if (node_type(expr) != "string") return std::nullopt;

    return PythonExtractor::clean_docstring(node_text(expr, content));
}

// Direct calls contribute the callee name, attribute calls the attribute name.
// Unknown callee shapes (subscripts, calls of calls) are skipped.
std::set<std::string> collect_calls(TSNode scope, const std::string& content) {
    std::set<std::string> calls;
    TSNode body = field(scope, "body");
    if (ts_node_is_null(body)) return calls;

    std::stack<TSNode> stack;
    stack.push(body);
    while (!stack.empty()) {
        TSNode node = stack.top();
        stack.pop();

        if (node_type(node) == "call") {
            TSNode callee = field(node, "function");
            if (!ts_node_is_null(callee)) {
                std::string callee_type = node_type(callee);
                if (callee_type == "identifier") {
                    calls.insert(node_text(callee, content));
                } else if (callee_type == "attribute") {
                    TSNode attr = field(callee, "attribute");
                    if (!ts_node_is_null(attr)) calls.insert(node_text(attr, content));
                }
            }
        }

        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; i++) stack.push(ts_node_named_child(node, i));
    }
    calls.erase("");
    return calls;
}

Symbol make_import(const std::string& file_path, TSNode stmt, const std::string& name, const std::string& definition) {
    Symbol symbol;
    symbol.name = name;
    symbol.kind = SymbolKind::Import;
    symbol.file_path = file_path;
    symbol.line_number = node_line(stmt);
    symbol.definition = definition;
    return symbol;
}

// The dotted name of an import clause, without any "as" alias
std::string imported_name(TSNode clause, const std::string& content) {
    if (node_type(clause) == "aliased_import") {
        TSNode name = field(clause, "name");
        if (!ts_node_is_null(name)) return node_text(name, content);
    }
    return node_text(clause, content);
}

void extract_imports(TSNode stmt, const std::string& file_path, const std::string& content, std::vector<Symbol>& out) {
    std::string type = node_type(stmt);
    uint32_t count = ts_node_child_count(stmt);

    if (type == "import_statement") {
        for (uint32_t i = 0; i < count; i++) {
            const char* field_name = ts_node_field_name_for_child(stmt, i);
            if (!field_name || std::string(field_name) != "name") continue;
            std::string name = imported_name(ts_node_child(stmt, i), content);
            out.push_back(make_import(file_path, stmt, name, "import " + name));
        }
        return;
    }

    // import_from_statement / future_import_statement
    std::string module = "__future__";
    TSNode module_node = field(stmt, "module_name");
    if (!ts_node_is_null(module_node)) module = node_text(module_node, content);

    for (uint32_t i = 0; i < count; i++) {
        TSNode child = ts_node_child(stmt, i);
        const char* field_name = ts_node_field_name_for_child(stmt, i);
        std::string name;
        if (field_name && std::string(field_name) == "name") {
            name = imported_name(child, content);
        } else if (node_type(child) == "wildcard_import") {
            name = "*";
        } else {
            continue;
        }
        out.push_back(make_import(file_path, stmt, module + "." + name, "from " + module + " import " + name));
    }
}

} // namespace

std::string PythonExtractor::clean_docstring(const std::string& literal) {
    std::string text = literal;

    size_t prefix = 0;
    while (prefix < text.size() && std::isalpha(static_cast<unsigned char>(text[prefix]))) prefix++;
    text = text.substr(prefix);

    size_t quote = 0;
    if (text.rfind("\"\"\"", 0) == 0 || text.rfind("'''", 0) == 0) quote = 3;
    else if (!text.empty() && (text[0] == '"' || text[0] == '\'')) quote = 1;
    if (quote > 0 && text.size() >= quote * 2) text = text.substr(quote, text.size() - quote * 2);

    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) lines.push_back(line);
    if (lines.empty()) return "";

    size_t indent = std::string::npos;
    for (size_t i = 1; i < lines.size(); ++i) {
        auto pos = lines[i].find_first_not_of(" \t");
        if (pos == std::string::npos) continue;
        indent = std::min(indent, pos);
    }

    lines[0] = trim(lines[0]);
    for (size_t i = 1; i < lines.size(); ++i) {
        if (indent != std::string::npos && lines[i].size() >= indent) lines[i] = lines[i].substr(indent);
        auto end = lines[i].find_last_not_of(" \t\r");
        lines[i] = end == std::string::npos ? "" : lines[i].substr(0, end + 1);
    }

    while (!lines.empty() && lines.back().empty()) lines.pop_back();
    size_t first = 0;
    while (first < lines.size() && lines[first].empty()) first++;

    std::string result;
    for (size_t i = first; i < lines.size(); ++i) {
        if (!result.empty() || i > first) result += "\n";
        result += lines[i];
    }
    return result;
}

std::vector<Symbol> PythonExtractor::extract(const std::string& file_path, const std::string& content) const {
    std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
    if (!ts_parser_set_language(parser.get(), tree_sitter_python())) {
        throw ParseError(file_path, "python grammar version mismatch");
    }

    std::unique_ptr<TSTree, TreeDeleter> tree(
        ts_parser_parse_string(parser.get(), nullptr, content.c_str(), static_cast<uint32_t>(content.length())));
    if (!tree) throw ParseError(file_path, "parser returned no tree");

    TSNode root = ts_tree_root_node(tree.get());
    if (ts_node_has_error(root)) {
        throw ParseError(file_path, "syntax error near line " + std::to_string(find_error_line(root)));
    }

    std::vector<Symbol> symbols;

    // Pre-order walk so symbols come out in source order
    std::stack<TSNode> stack;
    stack.push(root);

    while (!stack.empty()) {
        TSNode node = stack.top();
        stack.pop();

        std::string type = node_type(node);

        if (type == "function_definition" || type == "class_definition") {
            TSNode name_node = field(node, "name");
            if (!ts_node_is_null(name_node)) {
                Symbol symbol;
                symbol.name = node_text(name_node, content);
                symbol.kind = type == "class_definition" ? SymbolKind::Class : SymbolKind::Function;
                symbol.file_path = file_path;
                symbol.line_number = node_line(node);
                symbol.definition = first_line(node_text(node, content));
                symbol.docstring = extract_docstring(node, content);
                symbol.call_dependencies = collect_calls(node, content);
                symbols.push_back(std::move(symbol));
            }
        } else if (type == "import_statement" || type == "import_from_statement" ||
                   type == "future_import_statement") {
            extract_imports(node, file_path, content, symbols);
        }

        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = count; i > 0; --i) stack.push(ts_node_named_child(node, i - 1));
    }

    spdlog::debug("🛰️  AST pass complete: {} symbols in {}", symbols.size(), file_path);
    return symbols;
}

} // namespace codescope
