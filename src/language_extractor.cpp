#include "language_extractor.hpp"
#include "file_scanner.hpp"
#include "python_extractor.hpp"
#include "regex_extractor.hpp"
#include <filesystem>
#include <spdlog/spdlog.h>

namespace codescope {

void ExtractorRegistry::register_extractor(std::shared_ptr<const LanguageExtractor> extractor) {
    for (const auto& ext : extractor->extensions()) {
        auto clean = FileScanner::normalize_extension(ext);
        auto it = by_extension_.find(clean);
        if (it != by_extension_.end()) {
            spdlog::warn("Extension {} moved from {} to {}", clean, it->second->language(), extractor->language());
        }
        by_extension_[clean] = extractor.get();
    }
    spdlog::debug("Extractor registered: {}", extractor->language());
    extractors_.push_back(std::move(extractor));
}

const LanguageExtractor* ExtractorRegistry::for_extension(const std::string& extension) const {
    auto it = by_extension_.find(FileScanner::normalize_extension(extension));
    return it == by_extension_.end() ? nullptr : it->second;
}

const LanguageExtractor* ExtractorRegistry::for_file(const std::string& file_path) const {
    return for_extension(std::filesystem::path(file_path).extension().string());
}

std::vector<std::string> ExtractorRegistry::extensions_for_language(const std::string& language) const {
    std::vector<std::string> result;
    for (const auto& [ext, extractor] : by_extension_) {
        if (extractor->language() == language) result.push_back(ext);
    }
    return result;
}

std::vector<std::string> ExtractorRegistry::languages() const {
    std::vector<std::string> names;
    for (const auto& extractor : extractors_) names.push_back(extractor->language());
    return names;
}

ExtractorRegistry ExtractorRegistry::with_defaults() {
    ExtractorRegistry registry;
    registry.register_extractor(std::make_shared<PythonExtractor>());
    registry.register_extractor(std::make_shared<RegexExtractor>(RegexExtractor::javascript_family()));
    registry.register_extractor(std::make_shared<RegexExtractor>(RegexExtractor::go()));
    registry.register_extractor(std::make_shared<RegexExtractor>(RegexExtractor::rust()));
    registry.register_extractor(std::make_shared<RegexExtractor>(RegexExtractor::java()));
    return registry;
}

} // namespace codescope
