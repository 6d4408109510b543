#pragma once
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_types.hpp"
#include "index_snapshot.hpp"
#include "language_extractor.hpp"

namespace codescope {

struct CodeBlock {
    int line_number = 0;
    std::string text;
};

struct PatternMatch {
    std::string file_path;
    int line_number = 0;
    std::string code_block;
    double similarity = 0.0;

    nlohmann::json to_json() const;
};

struct PatternSearchResponse {
    QueryStatus status = QueryStatus::Ok;
    std::vector<PatternMatch> matches;
    size_t total_found = 0;

    nlohmann::json to_json() const;
};

class PatternSimilarityEngine {
public:
    PatternSimilarityEngine(const ExtractorRegistry& registry, size_t max_results)
        : registry_(registry), max_results_(max_results) {}

    // Jaccard similarity between the snippet's token set and every function/class
    // block of the indexed files of that language. Blocks at or above `threshold`
    // come back best first.
    PatternSearchResponse find_similar(const IndexSnapshot& snapshot, const std::string& snippet,
                                       const std::string& language, double threshold) const;

    // "py" -> "python", "ts"/"typescript" -> "javascript", ...
    static std::string canonical_language(const std::string& language);

    // Strips comments, collapses whitespace runs to one space
    static std::string normalize(const std::string& code, const std::string& language);

    // A block opens at a function/class line and runs until the next one at column 0
    static std::vector<CodeBlock> split_blocks(const std::string& content, const std::string& language);

    static std::set<std::string> tokenize(const std::string& normalized);
    static double jaccard(const std::set<std::string>& a, const std::set<std::string>& b);

private:
    const ExtractorRegistry& registry_;
    size_t max_results_;
};

} // namespace codescope
