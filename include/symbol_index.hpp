#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "code_types.hpp"

namespace codescope {

// File path -> symbol list, in insertion order (the directory-scan order of the
// build that first saw the file). Copies share the per-file lists, so taking a
// copy for the next snapshot generation is cheap.
class SymbolIndex {
public:
    // Replaces the file's entry wholesale. A new file is appended at the end.
    void upsert(const std::string& file_path, std::vector<Symbol> symbols, const std::string& content_hash = "");
    bool remove(const std::string& file_path);
    void clear();

    bool contains(const std::string& file_path) const;
    const std::vector<Symbol>& symbols_of(const std::string& file_path) const;
    std::vector<Symbol> all_symbols() const;
    void for_each_symbol(const std::function<void(const Symbol&)>& fn) const;

    std::optional<std::string> fingerprint_of(const std::string& file_path) const;
    std::vector<FileFingerprint> fingerprints() const;

    const std::vector<std::string>& files() const { return order_; }
    size_t file_count() const { return order_.size(); }
    size_t symbol_count() const;

    bool operator==(const SymbolIndex& other) const;

private:
    struct Entry {
        std::shared_ptr<const std::vector<Symbol>> symbols;
        std::string content_hash;
    };

    std::vector<std::string> order_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace codescope
