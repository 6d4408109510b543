#include "semantic_search.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace codescope {

using json = nlohmann::json;

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

json SemanticSearchResponse::to_json() const {
    if (status == QueryStatus::IndexNotBuilt) return status_error_json(status);

    json items = json::array();
    for (const auto& r : results) items.push_back(r.to_json());
    return json{
        {"success", status == QueryStatus::Ok},
        {"status", query_status_str(status)},
        {"results", items},
        {"total_found", total_found},
        {"cached", cached}
    };
}

double SemanticSearchEngine::score(const std::string& query, const Symbol& symbol) {
    std::string q = to_lower(query);
    std::string name = to_lower(symbol.name);
    double total = 0.0;

    if (q == name) {
        total += 1.0;
    } else if (contains(name, q)) {
        total += 0.7;
    } else {
        std::istringstream words(q);
        std::string word;
        while (words >> word) {
            if (contains(name, word)) {
                total += 0.5;
                break;
            }
        }
    }

    if (symbol.docstring && contains(to_lower(*symbol.docstring), q)) total += 0.4;
    if (contains(to_lower(symbol.definition), q)) total += 0.3;

    return std::min(total, 1.0);
}

FileContext SemanticSearchEngine::read_context(const fs::path& file, int line_number, int context_lines) {
    FileContext ctx;
    std::ifstream in(file);
    if (!in) {
        spdlog::warn("Context unavailable for {}", file.string());
        return ctx;
    }

    int first = std::max(1, line_number - context_lines);
    int last = line_number + context_lines;

    std::string line;
    int current = 0;
    while (current < last && std::getline(in, line)) {
        ++current;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto end = line.find_last_not_of(" \t");
        line = end == std::string::npos ? "" : line.substr(0, end + 1);

        if (current >= first && current < line_number) ctx.before.push_back(line);
        else if (current > line_number) ctx.after.push_back(line);
    }
    return ctx;
}

SemanticHitList SemanticSearchEngine::rank(const IndexSnapshot& snapshot, const std::string& query,
                                           const std::string& normalized_scope) const {
    SemanticHitList hits;
    std::string q = to_lower(query);

    for (const auto& file : snapshot.index().files()) {
        if (!IndexSnapshot::in_scope(file, normalized_scope)) continue;

        for (const auto& symbol : snapshot.index().symbols_of(file)) {
            double s = score(query, symbol);
            if (s <= kRelevanceThreshold) continue;
            MatchType type = to_lower(symbol.name) == q ? MatchType::Exact : MatchType::Semantic;
            hits.push_back({symbol, s, type});
        }
    }

    std::sort(hits.begin(), hits.end(), [](const SemanticHit& a, const SemanticHit& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.symbol.file_path != b.symbol.file_path) return a.symbol.file_path < b.symbol.file_path;
        return a.symbol.line_number < b.symbol.line_number;
    });
    return hits;
}

SemanticSearchResponse SemanticSearchEngine::search(const IndexSnapshot& snapshot, const std::string& query,
                                                    const std::string& scope, size_t max_results) const {
    SemanticSearchResponse response;

    std::string trimmed = query;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
    if (trimmed.empty()) return response;

    std::string normalized_scope = snapshot.normalize_scope(scope);
    std::string cache_key = query + '\x1f' + normalized_scope;

    std::shared_ptr<const SemanticHitList> hits;
    if (auto cached = snapshot.search_cache().get(cache_key)) {
        hits = *cached;
        response.cached = true;
    } else {
        hits = std::make_shared<const SemanticHitList>(rank(snapshot, query, normalized_scope));
        snapshot.search_cache().set(cache_key, hits);
    }

    response.total_found = hits->size();
    size_t limit = std::min(max_results, hits->size());
    response.results.reserve(limit);

    for (size_t i = 0; i < limit; ++i) {
        const auto& hit = (*hits)[i];
        auto ctx = read_context(snapshot.absolute_path(hit.symbol.file_path), hit.symbol.line_number, context_lines_);

        SearchResult result;
        result.file_path = hit.symbol.file_path;
        result.line_number = hit.symbol.line_number;
        result.matched_text = hit.symbol.definition;
        result.context_before = std::move(ctx.before);
        result.context_after = std::move(ctx.after);
        result.relevance_score = hit.score;
        result.match_type = hit.match_type;
        response.results.push_back(std::move(result));
    }
    return response;
}

} // namespace codescope
