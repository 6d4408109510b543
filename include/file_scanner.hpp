#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace codescope {

namespace fs = std::filesystem;

using Deadline = std::chrono::steady_clock::time_point;

struct ScannedFile {
    fs::path absolute_path;
    std::string file_path;      // relative to the scan root, '/' separated
    std::string content;
    std::string content_hash;
};

class FileScanner {
public:
    FileScanner(const std::vector<std::string>& extensions, const std::vector<std::string>& exclude_dirs);

    // Depth-first walk in name order. Excluded directories are pruned before descending.
    std::vector<fs::path> discover(const fs::path& root) const;

    // Same walk, abandoned once `deadline` passes; `timed_out` tells whether it was
    std::vector<fs::path> discover(const fs::path& root, Deadline deadline, bool& timed_out) const;

    // Lazy scan: reads and fingerprints one file at a time. Unreadable files are
    // logged and skipped. Returning false from `visit` stops the walk.
    void scan(const fs::path& root, const std::function<bool(ScannedFile&&)>& visit) const;

    bool accepts(const fs::path& file) const;
    bool is_excluded_dir(const std::string& dir_name) const;

    // Throws IoError when the file cannot be read or is not UTF-8 text
    static ScannedFile load(const fs::path& root, const fs::path& file);

    static std::string calculate_content_hash(const std::string& content);
    static std::string normalize_extension(std::string ext);
    static std::string relative_key(const fs::path& root, const fs::path& file);

private:
    // False when the deadline passed before the subtree was finished
    bool scan_directory_recursive(const fs::path& current_dir, std::vector<fs::path>& results,
                                  const Deadline* deadline) const;

    std::unordered_set<std::string> ext_set_;
    std::unordered_set<std::string> exclude_set_;
};

} // namespace codescope
