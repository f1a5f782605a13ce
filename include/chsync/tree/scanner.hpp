#pragma once

#include "chsync/core/result.hpp"
#include "chsync/events/observer.hpp"
#include "chsync/tree/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chsync::tree {

struct ScanOptions {
    std::uint64_t max_object_size = 2ULL * 1024 * 1024 * 1024;
    std::size_t max_depth = kMaxTreeDepth;
};

/**
 * @brief Walks a local folder and builds the validated tree to upload
 *
 * Depth-first, entries at each level visited in case-insensitive name order.
 * Local problems never abort the scan:
 * - invalid folder names and unreadable folders are errors; that subtree is
 *   left out and siblings are still scanned
 * - invalid file names, empty files and files above max_object_size are
 *   warnings; the file is left out
 * Only a missing or non-directory root fails the call.
 */
class TreeScanner {
public:
    explicit TreeScanner(ScanOptions options = {});

    /**
     * @brief Scan root; progress is reported after every visited entry
     */
    Result<TreeNode> scan(const std::filesystem::path& root, events::RunObserver* observer = nullptr);

    /**
     * @brief Counts, errors and warnings of the last scan
     */
    const ScanSummary& summary() const noexcept { return summary_; }

    /// Reason the name is rejected, or nullopt when it is acceptable
    static std::optional<std::string> validate_folder_name(const std::string& name);

    /// Reason the name is rejected, or nullopt when it is acceptable
    static std::optional<std::string> validate_file_name(const std::string& name);

private:
    void scan_folder(const std::filesystem::path& folder, std::size_t depth, TreeNode& out);

    void visit_file(const std::filesystem::path& path, const std::string& name, TreeNode& out);

    std::size_t count_entries(const std::filesystem::path& folder, std::size_t depth) const;

    void report_progress(const std::string& label);

    ScanOptions options_;
    ScanSummary summary_;
    events::RunObserver* observer_ = nullptr;
    std::size_t processed_ = 0;
    std::size_t total_ = 0;
};

} // namespace chsync::tree
