#pragma once
#include <tree_sitter/api.h>
#include <string>
#include <vector>
#include "language_extractor.hpp"

extern "C" {
    const TSLanguage* tree_sitter_python();
}

namespace codescope {

// Full parse with the tree-sitter Python grammar. Finds top-level and nested
// functions and classes (with docstrings and the names they call) and import
// statements. A file with a syntax error raises ParseError.
class PythonExtractor : public LanguageExtractor {
public:
    std::string language() const override { return "python"; }
    std::vector<std::string> extensions() const override { return {".py", ".pyw", ".pyi"}; }
    std::vector<Symbol> extract(const std::string& file_path, const std::string& content) const override;

    // Strips quotes and string prefixes, then removes common indentation
    static std::string clean_docstring(const std::string& literal);
};

} // namespace codescope
