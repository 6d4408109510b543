#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "code_types.hpp"

namespace codescope {

// Lines longer than this (minified bundles, generated tables) never reach std::regex
constexpr size_t kMaxRegexLineLength = 4096;

class LanguageExtractor {
public:
    virtual ~LanguageExtractor() = default;

    virtual std::string language() const = 0;
    virtual std::vector<std::string> extensions() const = 0;

    // Throws ParseError when the file cannot be parsed at all
    virtual std::vector<Symbol> extract(const std::string& file_path, const std::string& content) const = 0;
};

// Maps a file extension to the extractor that handles it. Adding a language means
// registering one more extractor.
class ExtractorRegistry {
public:
    void register_extractor(std::shared_ptr<const LanguageExtractor> extractor);

    // nullptr when no extractor handles the extension
    const LanguageExtractor* for_extension(const std::string& extension) const;
    const LanguageExtractor* for_file(const std::string& file_path) const;

    // Extensions registered for a language name such as "python" or "typescript"
    std::vector<std::string> extensions_for_language(const std::string& language) const;

    std::vector<std::string> languages() const;

    // Python (tree-sitter) plus the regex extractors
    static ExtractorRegistry with_defaults();

private:
    std::vector<std::shared_ptr<const LanguageExtractor>> extractors_;
    std::map<std::string, const LanguageExtractor*> by_extension_;
};

} // namespace codescope
