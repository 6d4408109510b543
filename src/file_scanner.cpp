#include "file_scanner.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace codescope {

namespace {

bool is_valid_utf8(const std::string& str) {
    size_t i = 0;
    while (i < str.size()) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        size_t extra = 0;
        if (c < 0x80) extra = 0;
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) extra = 1;
        else if ((c & 0xF0) == 0xE0) extra = 2;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) extra = 3;
        else return false;

        if (i + extra >= str.size() && extra > 0) return false;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(str[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace

FileScanner::FileScanner(const std::vector<std::string>& extensions, const std::vector<std::string>& exclude_dirs) {
    for (const auto& ext : extensions) {
        auto clean = normalize_extension(ext);
        if (!clean.empty()) ext_set_.insert(clean);
    }
    for (const auto& dir : exclude_dirs) {
        if (!dir.empty()) exclude_set_.insert(dir);
    }
}

std::string FileScanner::normalize_extension(std::string ext) {
    if (ext.empty()) return ext;
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    if (ext[0] != '.') ext = "." + ext;
    return ext;
}

std::string FileScanner::relative_key(const fs::path& root, const fs::path& file) {
    auto rel = file.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty()) return file.generic_string();
    return rel.generic_string();
}

bool FileScanner::accepts(const fs::path& file) const {
    return ext_set_.count(normalize_extension(file.extension().string())) > 0;
}

bool FileScanner::is_excluded_dir(const std::string& dir_name) const {
    return exclude_set_.count(dir_name) > 0;
}

std::string FileScanner::calculate_content_hash(const std::string& content) {
    // 64-bit FNV-1a
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : content) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return std::string(buf);
}

bool FileScanner::scan_directory_recursive(const fs::path& current_dir, std::vector<fs::path>& results,
                                           const Deadline* deadline) const {
    if (deadline && std::chrono::steady_clock::now() > *deadline) return false;

    std::vector<fs::directory_entry> entries;
    try {
        for (const auto& entry : fs::directory_iterator(current_dir)) {
            entries.push_back(entry);
        }
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Scanner skipped {}: {}", current_dir.string(), e.what());
        return true;
    }

    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        return a.path().filename().string() < b.path().filename().string();
    });

    for (const auto& entry : entries) {
        std::error_code ec;
        const auto& path = entry.path();

        if (entry.is_directory(ec) && !entry.is_symlink(ec)) {
            std::string name = path.filename().string();
            if (is_excluded_dir(name)) {
                spdlog::debug("DIR  | {} | SKIP", path.string());
                continue;
            }
            if (!scan_directory_recursive(path, results, deadline)) return false;
        } else if (entry.is_regular_file(ec)) {
            if (accepts(path)) results.push_back(path);
        }
    }
    return true;
}

std::vector<fs::path> FileScanner::discover(const fs::path& root) const {
    std::vector<fs::path> results;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        spdlog::warn("⚠️ Scan root is not a directory: {}", root.string());
        return results;
    }
    scan_directory_recursive(root, results, nullptr);
    return results;
}

std::vector<fs::path> FileScanner::discover(const fs::path& root, Deadline deadline, bool& timed_out) const {
    std::vector<fs::path> results;
    timed_out = false;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        spdlog::warn("⚠️ Scan root is not a directory: {}", root.string());
        return results;
    }
    if (!scan_directory_recursive(root, results, &deadline)) {
        timed_out = true;
        results.clear();
    }
    return results;
}

ScannedFile FileScanner::load(const fs::path& root, const fs::path& file) {
    std::ifstream in(file, std::ios::in | std::ios::binary);
    if (!in) throw IoError(file.string(), "cannot open file");

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) throw IoError(file.string(), "read failed");

    ScannedFile scanned;
    scanned.content = buffer.str();
    if (!is_valid_utf8(scanned.content)) throw IoError(file.string(), "content is not valid UTF-8");

    scanned.absolute_path = file;
    scanned.file_path = relative_key(root, file);
    scanned.content_hash = calculate_content_hash(scanned.content);
    return scanned;
}

void FileScanner::scan(const fs::path& root, const std::function<bool(ScannedFile&&)>& visit) const {
    for (const auto& file : discover(root)) {
        ScannedFile scanned;
        try {
            scanned = load(root, file);
        } catch (const IoError& e) {
            spdlog::warn("Skipping {}: {}", file.string(), e.what());
            continue;
        }
        if (!visit(std::move(scanned))) break;
    }
}

} // namespace codescope
