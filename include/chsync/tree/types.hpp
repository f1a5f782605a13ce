#pragma once

/**
 * @file types.hpp
 * @brief Tree model shared by the scanner, codec, differ and orchestrator
 *
 * WHY THIS FILE EXISTS:
 * A synchronized folder is represented as a recursive tree: each folder owns
 * its files (in scan order) and its subfolders (keyed by name). The same
 * shape is scanned from disk, decoded from the index server, diffed, merged
 * and finally encoded back to the index server.
 *
 * IDENTITY:
 * A file's identity across scans is its relative path ("docs/a.txt").
 * Content equality is size equality; no bytes are hashed.
 *
 * INVARIANT:
 * remote_object_id and remote_message_id are either both set or both empty.
 * assign_remote_ids() is the only way to set them on a scanned entry.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chsync::tree {

/// Recursion ceiling for every tree traversal
constexpr std::size_t kMaxTreeDepth = 50;

/// Longest accepted file or folder name
constexpr std::size_t kMaxNameLength = 255;

/**
 * @brief One uploadable file
 */
struct FileEntry {
    std::string name;
    std::uint64_t size = 0;
    std::filesystem::path local_path;              ///< Local only, never serialized
    std::optional<std::string> remote_object_id;
    std::optional<std::int64_t> remote_message_id;
    bool skip_transfer = false;                    ///< Set by merge when identifiers are reused

    bool has_remote_ids() const noexcept {
        return remote_object_id.has_value() && remote_message_id.has_value();
    }

    void assign_remote_ids(std::string object_id, std::int64_t message_id) {
        remote_object_id = std::move(object_id);
        remote_message_id = message_id;
    }

    void clear_remote_ids() noexcept {
        remote_object_id.reset();
        remote_message_id.reset();
    }
};

/**
 * @brief Orders folder names case-insensitively, ties broken bytewise
 *
 * Matches the order in which the scanner visits directory entries, so that
 * iterating subfolders reproduces scan order.
 */
struct FolderNameLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

/**
 * @brief One folder
 */
struct TreeNode {
    std::vector<FileEntry> files;
    std::map<std::string, TreeNode, FolderNameLess> subfolders;

    bool empty() const noexcept { return files.empty() && subfolders.empty(); }
};

/**
 * @brief A file together with its relative path inside the tree
 */
struct PathEntry {
    std::string relative_path;
    FileEntry entry;
};

/// Relative path -> file, ordered by path
using PathMap = std::map<std::string, FileEntry>;

/// Joins a parent path and a leaf name with '/'; an empty parent yields the leaf
std::string join_path(const std::string& parent, const std::string& name);

/// Case-insensitive ordering used for every sorted listing
bool name_less(const std::string& lhs, const std::string& rhs);

/// Well-formed UTF-8: no overlong forms, surrogates or code points past U+10FFFF
bool is_valid_utf8(const std::string& text) noexcept;

/**
 * @brief Counts produced by a scan
 */
struct ScanSummary {
    std::size_t total_files = 0;
    std::size_t total_folders = 0;
    std::uint64_t total_bytes = 0;
    std::size_t skipped_files = 0;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    double total_megabytes() const noexcept {
        return static_cast<double>(total_bytes) / (1024.0 * 1024.0);
    }
};

/**
 * @brief A path whose size changed between two trees
 */
struct ModifiedFile {
    FileEntry previous;   ///< Carries the obsolete remote identifiers
    FileEntry current;
};

/**
 * @brief Classification of every path of two trees
 *
 * The four maps are disjoint; their key union is the union of both trees'
 * paths. added holds current entries, removed and unchanged hold previous
 * entries (so their remote identifiers are at hand).
 */
struct ChangeSet {
    std::map<std::string, FileEntry> added;
    std::map<std::string, FileEntry> removed;
    std::map<std::string, ModifiedFile> modified;
    std::map<std::string, FileEntry> unchanged;
    std::size_t total_previous = 0;
    std::size_t total_current = 0;

    std::size_t changed_count() const noexcept {
        return added.size() + removed.size() + modified.size();
    }
};

} // namespace chsync::tree
