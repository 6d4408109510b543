#include <gtest/gtest.h>
#include <algorithm>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include "errors.hpp"
#include "file_scanner.hpp"
#include "test_support.hpp"

using namespace codescope;
using codescope::test::TempTree;

class FileScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tree_.write("src/b.py", "def b():\n    pass\n");
        tree_.write("src/a.py", "def a():\n    pass\n");
        tree_.write("lib/c.js", "function c() {}\n");
        tree_.write("node_modules/dep/x.py", "def x():\n    pass\n");
        tree_.write("README.md", "# readme\n");
    }

    std::vector<std::string> keys(const std::vector<fs::path>& files) const {
        std::vector<std::string> out;
        for (const auto& f : files) out.push_back(FileScanner::relative_key(tree_.root(), f));
        return out;
    }

    TempTree tree_;
};

TEST_F(FileScannerTest, DiscoversInNameOrderAndPrunesExcludedDirs) {
    FileScanner scanner({".py", ".js"}, {"node_modules"});
    auto found = keys(scanner.discover(tree_.root()));

    std::vector<std::string> expected = {"lib/c.js", "src/a.py", "src/b.py"};
    EXPECT_EQ(found, expected);
}

TEST_F(FileScannerTest, ExtensionFilterIsCaseInsensitive) {
    FileScanner scanner({"PY"}, {});
    EXPECT_TRUE(scanner.accepts("module.py"));
    EXPECT_TRUE(scanner.accepts("MODULE.PY"));
    EXPECT_FALSE(scanner.accepts("module.js"));
    EXPECT_EQ(FileScanner::normalize_extension("Py"), ".py");
    EXPECT_EQ(FileScanner::normalize_extension(".rs"), ".rs");
}

TEST_F(FileScannerTest, DiscoverOnMissingRootIsEmpty) {
    FileScanner scanner({".py"}, {});
    EXPECT_TRUE(scanner.discover(tree_.root() / "does_not_exist").empty());
}

TEST_F(FileScannerTest, ContentHashIsStableAndSensitive) {
    auto h1 = FileScanner::calculate_content_hash("def a(): pass");
    auto h2 = FileScanner::calculate_content_hash("def a(): pass");
    auto h3 = FileScanner::calculate_content_hash("def b(): pass");

    EXPECT_EQ(h1, h2);
    EXPECT_NE(h1, h3);
    EXPECT_EQ(h1.size(), 16u);
}

TEST_F(FileScannerTest, LoadProducesRelativeKeyAndHash) {
    auto scanned = FileScanner::load(tree_.root(), tree_.root() / "src" / "a.py");
    EXPECT_EQ(scanned.file_path, "src/a.py");
    EXPECT_EQ(scanned.content, "def a():\n    pass\n");
    EXPECT_EQ(scanned.content_hash, FileScanner::calculate_content_hash(scanned.content));
}

TEST_F(FileScannerTest, LoadRejectsMissingAndBinaryFiles) {
    EXPECT_THROW(FileScanner::load(tree_.root(), tree_.root() / "missing.py"), IoError);

    tree_.write("bin.py", std::string("\xff\xfe\x00\x01", 4));
    EXPECT_THROW(FileScanner::load(tree_.root(), tree_.root() / "bin.py"), IoError);
}

TEST_F(FileScannerTest, ScanSkipsUnreadableFilesAndContinues) {
    tree_.write("src/bad.py", std::string("x = '\xc3\x28'\n"));
    FileScanner scanner({".py"}, {"node_modules"});

    std::vector<std::string> visited;
    scanner.scan(tree_.root(), [&visited](ScannedFile&& file) {
        visited.push_back(file.file_path);
        return true;
    });

    std::vector<std::string> expected = {"src/a.py", "src/b.py"};
    EXPECT_EQ(visited, expected);
}

TEST_F(FileScannerTest, ScanStopsWhenVisitorReturnsFalse) {
    FileScanner scanner({".py", ".js"}, {"node_modules"});
    int count = 0;
    scanner.scan(tree_.root(), [&count](ScannedFile&&) {
        ++count;
        return false;
    });
    EXPECT_EQ(count, 1);
}

TEST_F(FileScannerTest, UnreadableDirectoryIsSkippedWithAWarning) {
    tree_.write("locked/hidden.py", "def hidden():\n    pass\n");
    const fs::path locked = tree_.root() / "locked";
    fs::permissions(locked, fs::perms::none);

    std::error_code ec;
    fs::directory_iterator listing(locked, ec);
    if (!ec) {
        fs::permissions(locked, fs::perms::owner_all);
        GTEST_SKIP() << "directory permissions are not enforced for this user";
    }

    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    auto previous = spdlog::default_logger();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("scanner_test", sink));

    FileScanner scanner({".py", ".js"}, {"node_modules"});
    auto found = keys(scanner.discover(tree_.root()));

    spdlog::set_default_logger(previous);
    fs::permissions(locked, fs::perms::owner_all);

    std::vector<std::string> expected = {"lib/c.js", "src/a.py", "src/b.py"};
    EXPECT_EQ(found, expected);

    auto messages = sink->last_formatted();
    EXPECT_TRUE(std::any_of(messages.begin(), messages.end(), [](const std::string& m) {
        return m.find("locked") != std::string::npos;
    }));
}

TEST_F(FileScannerTest, DiscoverWithPassedDeadlineTimesOut) {
    FileScanner scanner({".py", ".js"}, {"node_modules"});

    bool timed_out = false;
    auto found = scanner.discover(tree_.root(), std::chrono::steady_clock::now() - std::chrono::seconds(1), timed_out);
    EXPECT_TRUE(timed_out);
    EXPECT_TRUE(found.empty());

    found = scanner.discover(tree_.root(), std::chrono::steady_clock::now() + std::chrono::minutes(5), timed_out);
    EXPECT_FALSE(timed_out);
    EXPECT_EQ(found.size(), 3u);
}
