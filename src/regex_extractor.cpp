#include "regex_extractor.hpp"
#include <set>
#include <sstream>
#include <tuple>
#include <spdlog/spdlog.h>

namespace codescope {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

RegexExtractor::RegexExtractor(RegexLanguageSpec spec) : spec_(std::move(spec)) {
    auto compile = [this](const std::vector<std::string>& sources, SymbolKind kind) {
        for (const auto& src : sources) {
            try {
                patterns_.push_back({std::regex(src, std::regex::ECMAScript | std::regex::optimize), kind});
            } catch (const std::regex_error& e) {
                spdlog::error("Bad {} pattern '{}': {}", spec_.language, src, e.what());
            }
        }
    };
    compile(spec_.function_patterns, SymbolKind::Function);
    compile(spec_.class_patterns, SymbolKind::Class);
    compile(spec_.import_patterns, SymbolKind::Import);
}

std::vector<Symbol> RegexExtractor::extract(const std::string& file_path, const std::string& content) const {
    std::vector<Symbol> symbols;
    std::set<std::tuple<int, int, std::string>> seen;

    std::istringstream stream(content);
    std::string line;
    int line_number = 0;

    while (std::getline(stream, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        if (line.size() > kMaxRegexLineLength) {
            spdlog::debug("{}:{} skipped ({} bytes on one line)", file_path, line_number, line.size());
            continue;
        }

        for (const auto& pattern : patterns_) {
            try {
                auto begin = std::sregex_iterator(line.begin(), line.end(), pattern.re);
                for (auto it = begin; it != std::sregex_iterator(); ++it) {
                    std::string name = (*it)[1].str();
                    if (name.empty()) continue;
                    if (!seen.insert({line_number, static_cast<int>(pattern.kind), name}).second) continue;

                    Symbol symbol;
                    symbol.name = name;
                    symbol.kind = pattern.kind;
                    symbol.file_path = file_path;
                    symbol.line_number = line_number;
                    symbol.definition = trim(line);
                    symbols.push_back(std::move(symbol));
                }
            } catch (const std::regex_error& e) {
                // Pathological lines can exhaust the matcher; skip the line for this pattern only
                spdlog::debug("{}:{} pattern skipped: {}", file_path, line_number, e.what());
            }
        }
    }
    return symbols;
}

RegexLanguageSpec RegexExtractor::javascript_family() {
    return {
        "javascript",
        {".js", ".jsx", ".ts", ".tsx", ".mjs", ".cjs"},
        {
            R"((?:export\s+)?(?:default\s+)?(?:async\s+)?function\s*\*?\s*(\w+)\s*[<(])",
            R"((?:export\s+)?(?:const|let|var)\s+(\w+)\s*(?::[^=]+)?=\s*(?:async\s*)?\([^)]*\)\s*(?::[^=]+)?=>)",
            R"((?:export\s+)?(?:const|let|var)\s+(\w+)\s*=\s*(?:async\s+)?\w+\s*=>)"
        },
        {
            R"((?:export\s+)?(?:default\s+)?(?:abstract\s+)?class\s+(\w+))"
        },
        {
            R"(import\s+.*?\s+from\s+['"](.+?)['"])",
            R"(^\s*import\s+['"](.+?)['"])",
            R"(require\(\s*['"](.+?)['"]\s*\))"
        }
    };
}

RegexLanguageSpec RegexExtractor::go() {
    return {
        "go",
        {".go"},
        {
            R"(^\s*func\s+(?:\([^)]*\)\s*)?(\w+)\s*[(\[])"
        },
        {
            R"(^\s*type\s+(\w+)\s+(?:struct|interface)\b)"
        },
        {
            R"re(^\s*import\s+(?:[\w.]+\s+)?"([^"]+)")re"
        }
    };
}

RegexLanguageSpec RegexExtractor::rust() {
    return {
        "rust",
        {".rs"},
        {
            R"(^\s*(?:pub(?:\([^)]*\))?\s+)?(?:const\s+)?(?:async\s+)?(?:unsafe\s+)?(?:extern\s+"[^"]*"\s+)?fn\s+(\w+))"
        },
        {
            R"(^\s*(?:pub(?:\([^)]*\))?\s+)?(?:struct|enum|trait|union)\s+(\w+))"
        },
        {
            R"(^\s*(?:pub(?:\([^)]*\))?\s+)?use\s+([\w:]+))"
        }
    };
}

RegexLanguageSpec RegexExtractor::java() {
    return {
        "java",
        {".java"},
        {
            R"(^\s*(?:(?:public|protected|private|static|final|abstract|synchronized|native|default)\s+)+(?:<[^>]+>\s+)?[\w<>\[\],.? ]+\s+(\w+)\s*\()"
        },
        {
            R"(^\s*(?:(?:public|protected|private|abstract|final|static|sealed)\s+)*(?:class|interface|enum|record)\s+(\w+))"
        },
        {
            R"(^\s*import\s+(?:static\s+)?([\w.]+(?:\.\*)?)\s*;)"
        }
    };
}

} // namespace codescope
