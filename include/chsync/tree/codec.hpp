#pragma once

/**
 * @file codec.hpp
 * @brief Conversion between TreeNode and the JSON exchange form
 *
 * EXCHANGE FORM:
 * {
 *   "files": [ {"fileName": "a.txt", "fileSize": 100, "fileId": "BQAC...", "messageId": 12} ],
 *   "subfolders": { "docs": { "files": [...], "subfolders": {...} } }
 * }
 *
 * fileId/messageId are null for files that have not been transferred yet.
 * Local paths and the skip flag never leave the process.
 *
 * Every traversal carries an explicit depth counter and fails once it passes
 * max_depth, so corrupted or hostile input cannot exhaust the stack.
 */

#include "chsync/core/result.hpp"
#include "chsync/tree/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chsync::tree {

struct CodecOptions {
    std::size_t max_depth = kMaxTreeDepth;
    std::size_t min_object_id_length = 10;
};

class TreeCodec {
public:
    explicit TreeCodec(CodecOptions options = {});

    /// Strip local fields and emit the exchange form
    Result<nlohmann::json> serialize(const TreeNode& tree) const;

    /// Rebuild a tree from the exchange form; any structural defect is an error
    Result<TreeNode> deserialize(const nlohmann::json& exchange) const;

    /// deserialize() from text
    Result<TreeNode> parse(const std::string& text) const;

    /// Flatten to relative path -> file
    Result<PathMap> extract_path_map(const TreeNode& tree) const;

    /// Flatten to a list in scan order (files of a folder before its subfolders)
    Result<std::vector<PathEntry>> extract_entries(const TreeNode& tree) const;

    bool is_valid_object_id(const std::string& object_id) const;

    static bool is_valid_message_id(std::int64_t message_id) noexcept { return message_id > 0; }

    const CodecOptions& options() const noexcept { return options_; }

private:
    Result<nlohmann::json> serialize_node(const TreeNode& node, const std::string& path, std::size_t depth) const;

    Result<TreeNode> deserialize_node(const nlohmann::json& node, const std::string& path, std::size_t depth) const;

    Result<FileEntry> deserialize_file(const nlohmann::json& file, const std::string& path) const;

    Result<void> collect(const TreeNode& node,
                         const std::string& prefix,
                         std::size_t depth,
                         std::vector<PathEntry>& out) const;

    CodecOptions options_;
};

} // namespace chsync::tree
