#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace codescope::test {

namespace fs = std::filesystem;

// Throw-away source tree under the system temp directory
class TempTree {
public:
    TempTree() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = fs::temp_directory_path() /
                ("codescope_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        fs::create_directories(root_);
    }

    ~TempTree() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    fs::path write(const std::string& relative, const std::string& content) const {
        fs::path file = root_ / relative;
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::out | std::ios::binary | std::ios::trunc);
        out << content;
        return file;
    }

    void remove(const std::string& relative) const {
        std::error_code ec;
        fs::remove(root_ / relative, ec);
    }

    const fs::path& root() const { return root_; }
    std::string str() const { return root_.string(); }

private:
    fs::path root_;
};

} // namespace codescope::test
