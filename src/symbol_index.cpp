#include "symbol_index.hpp"
#include <algorithm>

namespace codescope {

void SymbolIndex::upsert(const std::string& file_path, std::vector<Symbol> symbols, const std::string& content_hash) {
    auto list = std::make_shared<const std::vector<Symbol>>(std::move(symbols));
    auto it = entries_.find(file_path);
    if (it == entries_.end()) {
        order_.push_back(file_path);
        entries_.emplace(file_path, Entry{std::move(list), content_hash});
    } else {
        it->second = Entry{std::move(list), content_hash};
    }
}

bool SymbolIndex::remove(const std::string& file_path) {
    if (entries_.erase(file_path) == 0) return false;
    order_.erase(std::remove(order_.begin(), order_.end(), file_path), order_.end());
    return true;
}

void SymbolIndex::clear() {
    order_.clear();
    entries_.clear();
}

bool SymbolIndex::contains(const std::string& file_path) const {
    return entries_.count(file_path) > 0;
}

const std::vector<Symbol>& SymbolIndex::symbols_of(const std::string& file_path) const {
    static const std::vector<Symbol> empty;
    auto it = entries_.find(file_path);
    if (it == entries_.end() || !it->second.symbols) return empty;
    return *it->second.symbols;
}

std::vector<Symbol> SymbolIndex::all_symbols() const {
    std::vector<Symbol> result;
    result.reserve(symbol_count());
    for_each_symbol([&result](const Symbol& s) { result.push_back(s); });
    return result;
}

void SymbolIndex::for_each_symbol(const std::function<void(const Symbol&)>& fn) const {
    for (const auto& path : order_) {
        for (const auto& symbol : symbols_of(path)) fn(symbol);
    }
}

std::optional<std::string> SymbolIndex::fingerprint_of(const std::string& file_path) const {
    auto it = entries_.find(file_path);
    if (it == entries_.end()) return std::nullopt;
    return it->second.content_hash;
}

std::vector<FileFingerprint> SymbolIndex::fingerprints() const {
    std::vector<FileFingerprint> result;
    for (const auto& path : order_) {
        result.push_back({path, entries_.at(path).content_hash});
    }
    return result;
}

size_t SymbolIndex::symbol_count() const {
    size_t total = 0;
    for (const auto& [path, entry] : entries_) {
        if (entry.symbols) total += entry.symbols->size();
    }
    return total;
}

bool SymbolIndex::operator==(const SymbolIndex& other) const {
    if (order_ != other.order_) return false;
    for (const auto& path : order_) {
        if (symbols_of(path) != other.symbols_of(path)) return false;
        if (fingerprint_of(path) != other.fingerprint_of(path)) return false;
    }
    return true;
}

} // namespace codescope
