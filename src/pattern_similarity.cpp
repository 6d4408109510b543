#include "pattern_similarity.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <spdlog/spdlog.h>

namespace codescope {

using json = nlohmann::json;

namespace {

// Declaration shapes that open a block, after optional indentation
std::string block_keywords(const std::string& language) {
    if (language == "python") return R"((?:async\s+)?(?:def|class)\s+\w+)";
    if (language == "javascript") return R"((?:export\s+)?(?:default\s+)?(?:async\s+)?(?:function|class)\s*\*?\s*\w+)";
    if (language == "go") return R"((?:func|type)\s+(?:\([^)]*\)\s*)?\w+)";
    if (language == "rust") return R"((?:pub(?:\([^)]*\))?\s+)?(?:async\s+)?(?:fn|struct|enum|trait|impl)\b)";
    if (language == "java") return R"((?:(?:public|protected|private|abstract|final|static)\s+)*(?:class|interface|enum|record)\s+\w+)";
    return R"((?:def|function|class)\s+\w+)";
}

bool uses_hash_comments(const std::string& language) {
    return language == "python";
}

bool uses_c_comments(const std::string& language) {
    return language == "javascript" || language == "go" || language == "rust" || language == "java";
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) return "";
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

json PatternMatch::to_json() const {
    return json{
        {"file_path", file_path},
        {"line_number", line_number},
        {"code_block", code_block},
        {"similarity", similarity},
        {"match_type", match_type_str(MatchType::Pattern)}
    };
}

json PatternSearchResponse::to_json() const {
    if (status == QueryStatus::IndexNotBuilt) return status_error_json(status);

    json items = json::array();
    for (const auto& m : matches) items.push_back(m.to_json());
    return json{
        {"success", status == QueryStatus::Ok},
        {"status", query_status_str(status)},
        {"results", items},
        {"total_found", total_found}
    };
}

std::string PatternSimilarityEngine::canonical_language(const std::string& language) {
    std::string lang = language;
    std::transform(lang.begin(), lang.end(), lang.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lang == "py") return "python";
    if (lang == "js" || lang == "jsx" || lang == "ts" || lang == "tsx" || lang == "typescript") return "javascript";
    if (lang == "golang") return "go";
    if (lang == "rs") return "rust";
    return lang;
}

std::string PatternSimilarityEngine::normalize(const std::string& code, const std::string& language) {
    std::string lang = canonical_language(language);
    bool hash_comments = uses_hash_comments(lang);
    bool c_comments = uses_c_comments(lang);

    // Single linear pass: comments are dropped and whitespace runs become one space
    std::string out;
    out.reserve(code.size());
    bool pending_space = false;
    size_t i = 0;
    const size_t n = code.size();

    while (i < n) {
        char c = code[i];
        if ((hash_comments && c == '#') || (c_comments && c == '/' && i + 1 < n && code[i + 1] == '/')) {
            while (i < n && code[i] != '\n') ++i;
            continue;
        }
        if (c_comments && c == '/' && i + 1 < n && code[i + 1] == '*') {
            auto close = code.find("*/", i + 2);
            if (close != std::string::npos) {
                i = close + 2;
                pending_space = pending_space || !out.empty();
                continue;
            }
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
        } else {
            if (pending_space) out += ' ';
            pending_space = false;
            out += c;
        }
        ++i;
    }
    return out;
}

std::vector<CodeBlock> PatternSimilarityEngine::split_blocks(const std::string& content, const std::string& language) {
    std::string keywords = block_keywords(canonical_language(language));
    const std::regex opens("^\\s*" + keywords);
    const std::regex top_level("^" + keywords);

    std::vector<CodeBlock> blocks;
    std::istringstream stream(content);
    std::string line;
    int line_number = 0;
    bool in_block = false;
    CodeBlock current;

    auto flush = [&]() {
        if (!in_block) return;
        while (!current.text.empty() && (current.text.back() == '\n' || current.text.back() == '\r')) {
            current.text.pop_back();
        }
        blocks.push_back(std::move(current));
        current = CodeBlock{};
        in_block = false;
    };

    while (std::getline(stream, line)) {
        ++line_number;
        bool starts_new = false;
        if (line.size() > kMaxRegexLineLength) {
            spdlog::debug("Line {} is {} bytes; not checked for a block header", line_number, line.size());
        } else {
            starts_new = in_block ? std::regex_search(line, top_level) : std::regex_search(line, opens);
        }
        if (starts_new) {
            flush();
            in_block = true;
            current.line_number = line_number;
        }
        if (in_block) current.text += line + "\n";
    }
    flush();
    return blocks;
}

std::set<std::string> PatternSimilarityEngine::tokenize(const std::string& normalized) {
    std::set<std::string> tokens;
    std::istringstream stream(normalized);
    std::string token;
    while (stream >> token) tokens.insert(token);
    return tokens;
}

double PatternSimilarityEngine::jaccard(const std::set<std::string>& a, const std::set<std::string>& b) {
    if (a.empty() && b.empty()) return 0.0;
    size_t intersection = 0;
    for (const auto& token : a) {
        if (b.count(token)) intersection++;
    }
    size_t union_size = a.size() + b.size() - intersection;
    return static_cast<double>(intersection) / static_cast<double>(union_size);
}

PatternSearchResponse PatternSimilarityEngine::find_similar(const IndexSnapshot& snapshot, const std::string& snippet,
                                                            const std::string& language, double threshold) const {
    PatternSearchResponse response;
    std::string lang = canonical_language(language);
    threshold = std::clamp(threshold, 0.0, 1.0);

    auto query_tokens = tokenize(normalize(snippet, lang));
    if (query_tokens.empty()) return response;

    // Unknown languages compare against every indexed file
    bool known_language = !registry_.extensions_for_language(lang).empty();

    std::vector<PatternMatch> found;
    for (const auto& file : snapshot.index().files()) {
        if (known_language) {
            const auto* extractor = registry_.for_file(file);
            if (!extractor || extractor->language() != lang) continue;
        }

        std::string content = read_file(snapshot.absolute_path(file));
        if (content.empty()) continue;

        for (auto& block : split_blocks(content, lang)) {
            double similarity = jaccard(query_tokens, tokenize(normalize(block.text, lang)));
            if (similarity <= 0.0 || similarity < threshold) continue;
            found.push_back({file, block.line_number, std::move(block.text), similarity});
        }
    }

    std::sort(found.begin(), found.end(), [](const PatternMatch& a, const PatternMatch& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        if (a.file_path != b.file_path) return a.file_path < b.file_path;
        return a.line_number < b.line_number;
    });

    response.total_found = found.size();
    if (found.size() > max_results_) found.resize(max_results_);
    response.matches = std::move(found);

    spdlog::debug("Pattern search ({}): {} blocks at or above {:.2f}", lang, response.total_found, threshold);
    return response;
}

} // namespace codescope
