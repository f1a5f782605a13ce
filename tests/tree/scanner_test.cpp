#include "chsync/tree/scanner.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using chsync::tree::ScanOptions;
using chsync::tree::TreeNode;
using chsync::tree::TreeScanner;

namespace {

fs::path create_temp_dir() {
    static std::atomic<std::uint64_t> counter{0};
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = fs::temp_directory_path() / fs::path("chsync_scan_test_" + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

bool contains(const std::vector<std::string>& messages, const std::string& needle) {
    for (const auto& message : messages) {
        if (message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

class RecordingObserver : public chsync::events::RunObserver {
public:
    struct Progress {
        std::size_t current;
        std::size_t total;
        std::string label;
    };

    void on_progress(std::size_t current, std::size_t total, const std::string& label) override {
        progress.push_back(Progress{current, total, label});
    }

    void on_log(chsync::events::LogLevel, const std::string&) override {}

    std::vector<Progress> progress;
};

} // namespace

class TreeScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
    }

    void TearDown() override {
        if (!root_.empty()) {
            std::error_code ec;
            fs::permissions(root_, fs::perms::owner_all, fs::perm_options::add, ec);
            fs::remove_all(root_, ec);
        }
    }

    fs::path root_;
};

TEST_F(TreeScannerTest, BuildsTreeWithSizesAndLocalPaths) {
    write_file(root_ / "readme.md", "hello");
    write_file(root_ / "docs" / "guide.txt", "0123456789");
    write_file(root_ / "docs" / "img" / "logo.png", "png");

    TreeScanner scanner;
    auto result = scanner.scan(root_);
    ASSERT_TRUE(result.is_ok()) << result.error();

    const TreeNode& tree = result.value();
    ASSERT_EQ(tree.files.size(), 1u);
    EXPECT_EQ(tree.files[0].name, "readme.md");
    EXPECT_EQ(tree.files[0].size, 5u);
    EXPECT_EQ(tree.files[0].local_path, root_ / "readme.md");
    EXPECT_FALSE(tree.files[0].has_remote_ids());

    ASSERT_EQ(tree.subfolders.count("docs"), 1u);
    const auto& docs = tree.subfolders.at("docs");
    ASSERT_EQ(docs.files.size(), 1u);
    EXPECT_EQ(docs.files[0].size, 10u);
    ASSERT_EQ(docs.subfolders.count("img"), 1u);
    EXPECT_EQ(docs.subfolders.at("img").files.size(), 1u);

    const auto& summary = scanner.summary();
    EXPECT_EQ(summary.total_files, 3u);
    EXPECT_EQ(summary.total_folders, 2u);
    EXPECT_EQ(summary.total_bytes, 18u);
    EXPECT_TRUE(summary.errors.empty());
    EXPECT_TRUE(summary.warnings.empty());
}

TEST_F(TreeScannerTest, OrdersEntriesCaseInsensitively) {
    write_file(root_ / "b.txt", "b");
    write_file(root_ / "A.txt", "a");
    write_file(root_ / "c.txt", "c");

    TreeScanner scanner;
    auto result = scanner.scan(root_);
    ASSERT_TRUE(result.is_ok());

    const auto& files = result.value().files;
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].name, "A.txt");
    EXPECT_EQ(files[1].name, "b.txt");
    EXPECT_EQ(files[2].name, "c.txt");
}

TEST_F(TreeScannerTest, SkipsEmptyAndOversizedFilesWithWarnings) {
    write_file(root_ / "empty.txt", "");
    write_file(root_ / "big.bin", std::string(64, 'x'));
    write_file(root_ / "ok.txt", "fine");

    TreeScanner scanner(ScanOptions{32, chsync::tree::kMaxTreeDepth});
    auto result = scanner.scan(root_);
    ASSERT_TRUE(result.is_ok());

    ASSERT_EQ(result.value().files.size(), 1u);
    EXPECT_EQ(result.value().files[0].name, "ok.txt");

    const auto& summary = scanner.summary();
    EXPECT_EQ(summary.skipped_files, 2u);
    EXPECT_TRUE(contains(summary.warnings, "Skipping empty file: empty.txt"));
    EXPECT_TRUE(contains(summary.warnings, "big.bin"));
    EXPECT_TRUE(summary.errors.empty());
}

TEST_F(TreeScannerTest, RejectsDangerousFolderButKeepsSiblings) {
    write_file(root_ / "a<script>" / "x.txt", "x");
    write_file(root_ / "good" / "y.txt", "y");

    TreeScanner scanner;
    auto result = scanner.scan(root_);
    ASSERT_TRUE(result.is_ok());

    EXPECT_EQ(result.value().subfolders.count("a<script>"), 0u);
    EXPECT_EQ(result.value().subfolders.count("good"), 1u);
    EXPECT_TRUE(contains(scanner.summary().errors, "Invalid folder 'a<script>'"));
    EXPECT_EQ(scanner.summary().total_files, 1u);
}

TEST_F(TreeScannerTest, EnforcesMaximumDepth) {
    write_file(root_ / "one" / "two" / "deep.txt", "deep");
    write_file(root_ / "one" / "shallow.txt", "shallow");

    TreeScanner scanner(ScanOptions{1024, 1});
    auto result = scanner.scan(root_);
    ASSERT_TRUE(result.is_ok());

    const auto& one = result.value().subfolders.at("one");
    EXPECT_EQ(one.files.size(), 1u);
    EXPECT_TRUE(one.subfolders.empty());
    EXPECT_TRUE(contains(scanner.summary().errors, "Folder nesting exceeds 1 levels"));
}

TEST_F(TreeScannerTest, UnreadableFolderIsReportedAndSkipped) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }

    write_file(root_ / "locked" / "secret.txt", "s");
    write_file(root_ / "open.txt", "o");
    fs::permissions(root_ / "locked", fs::perms::none);

    TreeScanner scanner;
    auto result = scanner.scan(root_);
    fs::permissions(root_ / "locked", fs::perms::owner_all);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().files.size(), 1u);
    EXPECT_TRUE(contains(scanner.summary().errors, "Permission denied"));
}

TEST_F(TreeScannerTest, MissingRootFails) {
    TreeScanner scanner;
    auto result = scanner.scan(root_ / "missing");
    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().find("Directory not found"), std::string::npos);
}

TEST_F(TreeScannerTest, FileRootFails) {
    write_file(root_ / "plain.txt", "p");
    TreeScanner scanner;
    auto result = scanner.scan(root_ / "plain.txt");
    ASSERT_TRUE(result.is_error());
    EXPECT_NE(result.error().find("Not a directory"), std::string::npos);
}

TEST_F(TreeScannerTest, NamesThatAreNotUtf8AreSkipped) {
    write_file(root_ / "caf\xc3\xa9.txt", "utf-8");
    write_file(root_ / std::string("caf\xe9.txt"), "latin-1");
    write_file(root_ / std::string("d\xe9p") / "inner.txt", "inner");

    TreeScanner scanner;
    auto result = scanner.scan(root_);
    ASSERT_TRUE(result.is_ok());

    const auto& tree = result.value();
    ASSERT_EQ(tree.files.size(), 1u);
    EXPECT_EQ(tree.files[0].name, "caf\xc3\xa9.txt");
    EXPECT_TRUE(tree.subfolders.empty());
    EXPECT_TRUE(contains(scanner.summary().warnings, "File name is not valid UTF-8"));
    EXPECT_TRUE(contains(scanner.summary().errors, "Folder name is not valid UTF-8"));
    EXPECT_EQ(scanner.summary().skipped_files, 1u);
}

TEST_F(TreeScannerTest, FolderSymlinksAreNotFollowed) {
    write_file(root_ / "docs" / "a.txt", "a");
    std::error_code ec;
    fs::create_directory_symlink(root_, root_ / "docs" / "loop", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }
    fs::create_symlink(root_ / "docs" / "a.txt", root_ / "alias.txt", ec);
    ASSERT_FALSE(ec);

    TreeScanner scanner;
    auto result = scanner.scan(root_);
    ASSERT_TRUE(result.is_ok());

    const auto& docs = result.value().subfolders.at("docs");
    EXPECT_TRUE(docs.subfolders.empty());
    EXPECT_EQ(docs.files.size(), 1u);
    EXPECT_EQ(result.value().files.size(), 1u);
    EXPECT_EQ(scanner.summary().total_files, 2u);
    EXPECT_EQ(scanner.summary().total_folders, 1u);
    EXPECT_TRUE(contains(scanner.summary().warnings, "Skipping symbolic link to folder: loop"));
}

TEST_F(TreeScannerTest, ProgressIsBoundedAndEndsAtTotal) {
    write_file(root_ / "a.txt", "a");
    write_file(root_ / "sub" / "b.txt", "b");
    write_file(root_ / "sub" / "c.txt", "c");

    RecordingObserver observer;
    TreeScanner scanner;
    ASSERT_TRUE(scanner.scan(root_, &observer).is_ok());

    ASSERT_FALSE(observer.progress.empty());
    for (const auto& step : observer.progress) {
        EXPECT_GE(step.current, 1u);
        EXPECT_LE(step.current, step.total);
    }
    EXPECT_EQ(observer.progress.back().current, observer.progress.back().total);
}

TEST(TreeScannerNameTest, FolderNameRules) {
    EXPECT_FALSE(TreeScanner::validate_folder_name("photos 2024").has_value());
    EXPECT_TRUE(TreeScanner::validate_folder_name("").has_value());
    EXPECT_TRUE(TreeScanner::validate_folder_name("   ").has_value());
    EXPECT_TRUE(TreeScanner::validate_folder_name("a..b").has_value());
    EXPECT_TRUE(TreeScanner::validate_folder_name("JavaScript:alert").has_value());
    EXPECT_TRUE(TreeScanner::validate_folder_name("img onerror=x").has_value());
    EXPECT_TRUE(TreeScanner::validate_folder_name("__proto__").has_value());
    EXPECT_TRUE(TreeScanner::validate_folder_name("${HOME}").has_value());
    EXPECT_TRUE(TreeScanner::validate_folder_name("what?").has_value());
    EXPECT_TRUE(TreeScanner::validate_folder_name(std::string(256, 'a')).has_value());
}

TEST(TreeScannerNameTest, FileNameRules) {
    EXPECT_FALSE(TreeScanner::validate_file_name("report (final).pdf").has_value());
    EXPECT_FALSE(TreeScanner::validate_file_name("what?.txt").has_value());
    EXPECT_TRUE(TreeScanner::validate_file_name("").has_value());
    EXPECT_TRUE(TreeScanner::validate_file_name("a/b").has_value());
    EXPECT_TRUE(TreeScanner::validate_file_name(std::string("bad\x01name")).has_value());
    EXPECT_FALSE(TreeScanner::validate_file_name("\xe6\x97\xa5\xe8\xa8\x98.txt").has_value());
    EXPECT_TRUE(TreeScanner::validate_file_name(std::string("caf\xe9.txt")).has_value());
}

TEST(TreeScannerNameTest, Utf8Validation) {
    using chsync::tree::is_valid_utf8;
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("plain.txt"));
    EXPECT_TRUE(is_valid_utf8("\xf0\x9f\x93\x81 folder"));
    EXPECT_FALSE(is_valid_utf8(std::string("\xc0\xaf")));          // overlong '/'
    EXPECT_FALSE(is_valid_utf8(std::string("\xed\xa0\x80")));      // surrogate
    EXPECT_FALSE(is_valid_utf8(std::string("\xf4\x90\x80\x80")));  // past U+10FFFF
    EXPECT_FALSE(is_valid_utf8(std::string("abc\xe2\x82")));       // truncated
}
