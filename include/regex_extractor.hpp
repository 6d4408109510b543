#pragma once
#include <regex>
#include <string>
#include <vector>
#include "language_extractor.hpp"

namespace codescope {

// Line patterns for one language family. Capture group 1 is the symbol name.
struct RegexLanguageSpec {
    std::string language;
    std::vector<std::string> extensions;
    std::vector<std::string> function_patterns;
    std::vector<std::string> class_patterns;
    std::vector<std::string> import_patterns;
};

// Pattern-matching fallback for languages without a parser. Finds function, class and
// import shapes line by line; dynamic or aliased calls are not seen, so
// call_dependencies stay empty.
class RegexExtractor : public LanguageExtractor {
public:
    explicit RegexExtractor(RegexLanguageSpec spec);

    std::string language() const override { return spec_.language; }
    std::vector<std::string> extensions() const override { return spec_.extensions; }
    std::vector<Symbol> extract(const std::string& file_path, const std::string& content) const override;

    static RegexLanguageSpec javascript_family();
    static RegexLanguageSpec go();
    static RegexLanguageSpec rust();
    static RegexLanguageSpec java();

private:
    struct CompiledPattern {
        std::regex re;
        SymbolKind kind;
    };

    RegexLanguageSpec spec_;
    std::vector<CompiledPattern> patterns_;
};

} // namespace codescope
