#include "index_service.hpp"
#include "LogManager.hpp"
#include "ThreadPool.hpp"
#include "errors.hpp"
#include <future>
#include <set>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace codescope {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;

namespace {

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

// Resolves symlinks in the existing part of the path; the rest is kept lexically normalized
fs::path canonical_path(const fs::path& path) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(path, ec);
    if (ec) return fs::absolute(path).lexically_normal();
    return canonical;
}

// Puts the engine state back on every exit path that did not publish a snapshot
class StateRestorer {
public:
    StateRestorer(std::atomic<EngineState>& state, EngineState next)
        : state_(state), previous_(state.load()) {
        state_ = next;
    }
    ~StateRestorer() {
        if (!published_) state_ = previous_;
    }

    StateRestorer(const StateRestorer&) = delete;
    StateRestorer& operator=(const StateRestorer&) = delete;

    void published() { published_ = true; }

private:
    std::atomic<EngineState>& state_;
    EngineState previous_;
    bool published_ = false;
};

} // namespace

std::string engine_state_str(EngineState state) {
    switch (state) {
        case EngineState::Empty: return "EMPTY";
        case EngineState::Indexing: return "INDEXING";
        case EngineState::Ready: return "READY";
    }
    return "EMPTY";
}

std::string index_status_str(IndexStatus status) {
    switch (status) {
        case IndexStatus::Ok: return "ok";
        case IndexStatus::InvalidRoot: return "invalid_root";
        case IndexStatus::BudgetExceeded: return "budget_exceeded";
        case IndexStatus::IndexNotBuilt: return "index_not_built";
    }
    return "ok";
}

json IndexReport::to_json() const {
    return json{
        {"success", status == IndexStatus::Ok},
        {"status", index_status_str(status)},
        {"indexed_files", indexed_files},
        {"total_symbols", total_symbols},
        {"updated_files", updated_files},
        {"unchanged_files", unchanged_files},
        {"removed_files", removed_files},
        {"skipped_files", skipped_files},
        {"parse_errors", parse_errors},
        {"elapsed_seconds", elapsed_seconds},
        {"generation", generation},
        {"root", root}
    };
}

IndexService::IndexService(EngineConfig config, ExtractorRegistry registry)
    : config_(std::move(config)),
      registry_(std::move(registry)),
      semantic_engine_(config_.context_lines),
      pattern_engine_(registry_, config_.max_pattern_results),
      dead_code_detector_(config_.entry_points) {}

std::shared_ptr<const IndexSnapshot> IndexService::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return current_;
}

std::vector<Symbol> IndexService::extract_symbols(const ScannedFile& scanned, bool& parse_error) const {
    parse_error = false;
    const LanguageExtractor* extractor = registry_.for_file(scanned.file_path);
    if (!extractor) return {};

    try {
        return extractor->extract(scanned.file_path, scanned.content);
    } catch (const ParseError& e) {
        spdlog::warn("⚠️ {} (indexed with no symbols)", e.what());
        parse_error = true;
        return {};
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ {} extractor failed on {}: {} (indexed with no symbols)", extractor->language(),
                     scanned.file_path, e.what());
        parse_error = true;
        return {};
    }
}

IndexService::FileOutcome IndexService::process_file(const fs::path& root, const fs::path& file,
                                                     const SymbolIndex* base) const {
    FileOutcome outcome;
    ScannedFile scanned;
    try {
        scanned = FileScanner::load(root, file);
    } catch (const IoError& e) {
        spdlog::warn("⚠️ Skipping {}", e.what());
        outcome.kind = FileOutcome::Kind::Skipped;
        outcome.file_path = FileScanner::relative_key(root, file);
        return outcome;
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Skipping {}: {}", file.string(), e.what());
        outcome.kind = FileOutcome::Kind::Skipped;
        outcome.file_path = FileScanner::relative_key(root, file);
        return outcome;
    }

    outcome.file_path = scanned.file_path;
    outcome.content_hash = scanned.content_hash;

    if (base) {
        auto previous_hash = base->fingerprint_of(scanned.file_path);
        if (previous_hash && *previous_hash == scanned.content_hash) {
            outcome.kind = FileOutcome::Kind::Unchanged;
            return outcome;
        }
    }

    outcome.symbols = extract_symbols(scanned, outcome.parse_error);
    outcome.kind = FileOutcome::Kind::Updated;
    return outcome;
}

uint64_t IndexService::publish(fs::path root, IndexRequest request, SymbolIndex index, DependencyGraph graph) {
    uint64_t generation = ++generation_;
    auto next = std::make_shared<const IndexSnapshot>(generation, std::move(root), std::move(request),
                                                      std::move(index), std::move(graph),
                                                      config_.search_cache_entries);
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        current_ = std::move(next);
    }
    state_ = EngineState::Ready;
    return generation;
}

IndexReport IndexService::index_codebase(const IndexRequest& request) {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    auto start = Clock::now();

    IndexReport report;
    report.root = request.root;

    std::error_code ec;
    if (request.root.empty() || !fs::is_directory(request.root, ec)) {
        spdlog::error("❌ Index root is not a directory: '{}'", request.root);
        report.status = IndexStatus::InvalidRoot;
        return report;
    }

    fs::path root = canonical_path(request.root);
    report.root = root.string();

    IndexRequest effective = request;
    effective.root = root.string();
    if (effective.extensions.empty()) effective.extensions = config_.extensions;
    if (effective.exclude_dirs.empty()) effective.exclude_dirs = config_.exclude_dirs;

    auto previous = snapshot();
    std::shared_ptr<const IndexSnapshot> base;
    if (previous && previous->root() == root) base = previous;

    StateRestorer state_guard(state_, EngineState::Indexing);
    spdlog::info("🔍 Indexing {} ({})", root.string(), base ? "incremental" : "full");

    const long long budget_ms = request.time_budget_ms >= 0 ? request.time_budget_ms : config_.index_time_budget_ms;
    const auto deadline = start + std::chrono::milliseconds(budget_ms);

    auto budget_exceeded = [&]() {
        report.status = IndexStatus::BudgetExceeded;
        report.elapsed_seconds = seconds_since(start);
        spdlog::error("⏱️ Index budget of {} ms exceeded for {}; keeping the previous snapshot",
                      budget_ms, root.string());
        record_index_trace("index_codebase", report.root, report);
        return report;
    };

    FileScanner scanner(effective.extensions, effective.exclude_dirs);
    std::vector<fs::path> files;
    if (budget_ms > 0) {
        bool timed_out = false;
        files = scanner.discover(root, deadline, timed_out);
        if (timed_out) return budget_exceeded();
    } else {
        files = scanner.discover(root);
    }

    std::atomic<bool> aborted{false};
    const SymbolIndex* base_index = base ? &base->index() : nullptr;

    std::vector<FileOutcome> outcomes;
    outcomes.reserve(files.size());
    {
        ThreadPool pool(config_.worker_threads);
        std::vector<std::future<FileOutcome>> futures;
        futures.reserve(files.size());

        for (const auto& file : files) {
            futures.push_back(pool.enqueue([this, &root, file, base_index, budget_ms, deadline, &aborted]() {
                if (aborted.load()) return FileOutcome{FileOutcome::Kind::Aborted, "", "", {}, false};
                if (budget_ms > 0 && Clock::now() > deadline) {
                    aborted = true;
                    return FileOutcome{FileOutcome::Kind::Aborted, "", "", {}, false};
                }
                return process_file(root, file, base_index);
            }));
        }
        // Results are consumed in discovery order so the index order is deterministic
        for (auto& f : futures) outcomes.push_back(f.get());
    }

    if (aborted.load() || (budget_ms > 0 && Clock::now() > deadline)) return budget_exceeded();

    SymbolIndex index = base ? base->index() : SymbolIndex{};
    std::set<std::string> changed;
    std::unordered_set<std::string> seen;

    for (auto& outcome : outcomes) {
        switch (outcome.kind) {
            case FileOutcome::Kind::Skipped:
                report.skipped_files++;
                break;
            case FileOutcome::Kind::Unchanged:
                report.unchanged_files++;
                seen.insert(outcome.file_path);
                break;
            case FileOutcome::Kind::Updated:
                report.updated_files++;
                if (outcome.parse_error) report.parse_errors++;
                seen.insert(outcome.file_path);
                changed.insert(outcome.file_path);
                index.upsert(outcome.file_path, std::move(outcome.symbols), outcome.content_hash);
                break;
            case FileOutcome::Kind::Aborted:
                break;
        }
    }

    if (base) {
        std::vector<std::string> vanished;
        for (const auto& file : index.files()) {
            if (!seen.count(file)) vanished.push_back(file);
        }
        for (const auto& file : vanished) {
            index.remove(file);
            changed.insert(file);
            report.removed_files++;
        }
    }

    DependencyGraph graph = base ? DependencyGraphBuilder::rebuild(base->graph(), base->index(), index, changed)
                                 : DependencyGraphBuilder::build(index);

    report.indexed_files = index.file_count();
    report.total_symbols = index.symbol_count();
    report.generation = publish(root, std::move(effective), std::move(index), std::move(graph));
    state_guard.published();
    report.elapsed_seconds = seconds_since(start);

    spdlog::info("✅ Indexed {} files, {} symbols (updated {}, unchanged {}, removed {}, skipped {}) in {:.3f}s",
                 report.indexed_files, report.total_symbols, report.updated_files, report.unchanged_files,
                 report.removed_files, report.skipped_files, report.elapsed_seconds);

    record_index_trace("index_codebase", report.root, report);
    return report;
}

IndexReport IndexService::reindex_file(const std::string& path) {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    auto start = Clock::now();

    IndexReport report;
    auto previous = snapshot();
    if (!previous) {
        report.status = IndexStatus::IndexNotBuilt;
        record_index_trace("reindex_file", path, report);
        return report;
    }

    const fs::path& root = previous->root();
    report.root = root.string();
    report.generation = previous->generation();

    fs::path file(path);
    if (file.is_relative()) file = root / file;
    file = canonical_path(file);

    std::string key = FileScanner::relative_key(root, file);
    if (fs::path(key).is_absolute() || key.rfind("..", 0) == 0) {
        spdlog::error("❌ {} is outside the indexed root {}", path, root.string());
        report.status = IndexStatus::InvalidRoot;
        record_index_trace("reindex_file", path, report);
        return report;
    }

    StateRestorer state_guard(state_, EngineState::Indexing);
    SymbolIndex index = previous->index();

    // Leaves the current snapshot in place
    auto unchanged = [&]() {
        report.indexed_files = index.file_count();
        report.total_symbols = index.symbol_count();
        report.elapsed_seconds = seconds_since(start);
        record_index_trace("reindex_file", key, report);
        return report;
    };

    const auto& request = previous->request();
    FileScanner scanner(request.extensions, request.exclude_dirs);

    std::error_code ec;
    bool exists = fs::is_regular_file(file, ec);

    if (!exists) {
        if (!index.remove(key)) return unchanged();
        report.removed_files = 1;
    } else {
        bool excluded = !scanner.accepts(file);
        for (const auto& part : fs::path(key).parent_path()) {
            if (scanner.is_excluded_dir(part.string())) excluded = true;
        }
        if (excluded) {
            spdlog::debug("{} is not an indexed file type or lives in an excluded directory", key);
            report.skipped_files = 1;
            return unchanged();
        }

        FileOutcome outcome = process_file(root, file, &index);
        if (outcome.kind == FileOutcome::Kind::Skipped) {
            report.skipped_files = 1;
            return unchanged();
        }
        if (outcome.kind == FileOutcome::Kind::Unchanged) {
            report.unchanged_files = 1;
            return unchanged();
        }
        if (outcome.parse_error) report.parse_errors = 1;
        report.updated_files = 1;
        index.upsert(key, std::move(outcome.symbols), outcome.content_hash);
    }

    DependencyGraph graph = DependencyGraphBuilder::rebuild(previous->graph(), previous->index(), index, {key});

    report.indexed_files = index.file_count();
    report.total_symbols = index.symbol_count();
    report.generation = publish(root, request, std::move(index), std::move(graph));
    state_guard.published();
    report.elapsed_seconds = seconds_since(start);

    spdlog::info("🔄 Re-indexed {} ({}), generation {}", key, report.removed_files ? "removed" : "updated",
                 report.generation);
    record_index_trace("reindex_file", key, report);
    return report;
}

void IndexService::record_index_trace(const std::string& operation, const std::string& detail,
                                      const IndexReport& report) const {
    LogManager::instance().add_trace({LogManager::now_ms(), operation, detail, index_status_str(report.status),
                                      report.indexed_files, report.elapsed_seconds * 1000.0});
}

void IndexService::record_trace(const std::string& operation, const std::string& detail, QueryStatus status,
                                size_t result_count, Clock::time_point start) const {
    double duration_ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    LogManager::instance().add_trace({LogManager::now_ms(), operation, detail, query_status_str(status),
                                      result_count, duration_ms});
}

SemanticSearchResponse IndexService::semantic_search(const std::string& query, const std::string& scope,
                                                     size_t max_results) {
    auto start = Clock::now();
    auto snap = snapshot();

    SemanticSearchResponse response;
    if (!snap) {
        response.status = QueryStatus::IndexNotBuilt;
    } else {
        response = semantic_engine_.search(*snap, query, scope, max_results);
    }
    record_trace("semantic_search", query, response.status, response.results.size(), start);
    return response;
}

PatternSearchResponse IndexService::find_similar_patterns(const std::string& snippet, const std::string& language,
                                                          double threshold) {
    auto start = Clock::now();
    auto snap = snapshot();

    PatternSearchResponse response;
    if (!snap) {
        response.status = QueryStatus::IndexNotBuilt;
    } else {
        response = pattern_engine_.find_similar(*snap, snippet, language, threshold);
    }
    record_trace("find_similar_patterns", language, response.status, response.matches.size(), start);
    return response;
}

DependencyReport IndexService::analyze_dependencies(const std::string& symbol, const std::string& file_path) {
    auto start = Clock::now();
    auto snap = snapshot();

    DependencyReport report;
    report.symbol = symbol;
    if (!snap) {
        report.status = QueryStatus::IndexNotBuilt;
    } else if (auto key = SymbolNavigator::resolve_key(*snap, symbol, file_path)) {
        report = ImpactAnalyzer::dependencies_of(snap->graph(), *key);
    } else {
        report.status = QueryStatus::NotFound;
    }
    record_trace("analyze_dependencies", symbol, report.status,
                 report.depends_on.size() + report.depended_by.size(), start);
    return report;
}

ImpactReport IndexService::impact_analysis(const std::string& symbol, const std::string& file_path) {
    auto start = Clock::now();
    auto snap = snapshot();

    ImpactReport report;
    report.symbol = symbol;
    if (!snap) {
        report.status = QueryStatus::IndexNotBuilt;
    } else if (auto key = SymbolNavigator::resolve_key(*snap, symbol, file_path)) {
        report = ImpactAnalyzer::impact_of(snap->graph(), *key);
    } else {
        report.status = QueryStatus::NotFound;
    }
    record_trace("impact_analysis", symbol, report.status, report.affected_symbols.size(), start);
    return report;
}

DeadCodeResponse IndexService::detect_dead_code(const std::string& scope) {
    auto start = Clock::now();
    auto snap = snapshot();

    DeadCodeResponse response;
    if (!snap) {
        response.status = QueryStatus::IndexNotBuilt;
    } else {
        response = dead_code_detector_.find_dead_code(*snap, scope);
    }
    record_trace("detect_dead_code", scope, response.status, response.entries.size(), start);
    return response;
}

DefinitionResponse IndexService::find_definition(const std::string& symbol) {
    auto start = Clock::now();
    auto snap = snapshot();

    DefinitionResponse response;
    if (!snap) {
        response.status = QueryStatus::IndexNotBuilt;
    } else {
        response = SymbolNavigator::find_definition(*snap, symbol);
    }
    record_trace("find_definition", symbol, response.status, response.matches.size(), start);
    return response;
}

ReferencesResponse IndexService::find_references(const std::string& symbol) {
    auto start = Clock::now();
    auto snap = snapshot();

    ReferencesResponse response;
    if (!snap) {
        response.status = QueryStatus::IndexNotBuilt;
    } else {
        response = SymbolNavigator::find_references(*snap, symbol);
    }
    record_trace("find_references", symbol, response.status, response.references.size(), start);
    return response;
}

void IndexService::clear() {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        current_.reset();
    }
    state_ = EngineState::Empty;
    spdlog::info("🧹 Index cleared");
}

json IndexService::status_json() const {
    auto snap = snapshot();
    json status = {
        {"success", true},
        {"state", engine_state_str(state_.load())},
        {"generation", snap ? snap->generation() : 0}
    };
    if (snap) {
        auto& cache = snap->search_cache();
        status["root"] = snap->root().string();
        status["indexed_files"] = snap->index().file_count();
        status["total_symbols"] = snap->index().symbol_count();
        status["graph_nodes"] = snap->graph().node_count();
        status["graph_edges"] = snap->graph().edge_count();
        status["cache"] = {
            {"entries", cache.size()},
            {"capacity", cache.capacity()},
            {"hits", cache.hits()},
            {"misses", cache.misses()}
        };
    }
    status["languages"] = registry_.languages();
    return status;
}

} // namespace codescope
