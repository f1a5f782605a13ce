#pragma once

#include "chsync/core/result.hpp"
#include "chsync/tree/codec.hpp"
#include "chsync/tree/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace chsync::tree {

/**
 * @brief Compares a previous remote tree with a fresh scan and merges them
 *
 * Paths are the join key, size is the only change signal. A file rewritten in
 * place with the same size is reported as unchanged.
 *
 * All traversals share the codec's depth ceiling.
 */
class TreeDiffer {
public:
    explicit TreeDiffer(CodecOptions options = {});

    /**
     * @brief Classify every path of both trees
     *
     * added = current - previous, removed = previous - current; common paths
     * are modified when the sizes differ and unchanged otherwise.
     */
    Result<ChangeSet> diff(const TreeNode& previous, const TreeNode& current) const;

    /**
     * @brief Copy of current where unchanged files reuse their remote identifiers
     *
     * A file reuses identifiers only when its path is in changes.unchanged and
     * the previous entry carries both identifiers; it is then flagged
     * skip_transfer. Every other file has no identifiers and is not skipped.
     */
    Result<TreeNode> merge_with_previous(const ChangeSet& changes, const TreeNode& current) const;

    /// Files still to transfer, in scan order
    Result<std::vector<PathEntry>> files_pending_transfer(const TreeNode& merged) const;

    /// Old entries whose remote objects are obsolete: removed plus the previous side of modified
    static std::vector<PathEntry> files_pending_deletion(const ChangeSet& changes);

    /// 100 * changed / max(|previous|, |current|, 1), clamped to [0, 100]
    static double change_percentage(const ChangeSet& changes) noexcept;

    /**
     * @brief Record identifiers of a completed transfer at relative_path
     *
     * Fails when no file exists at that path.
     */
    static Result<void> assign_remote_ids(TreeNode& tree,
                                          const std::string& relative_path,
                                          const std::string& object_id,
                                          std::int64_t message_id);

private:
    Result<void> merge_node(TreeNode& node,
                            const std::string& prefix,
                            std::size_t depth,
                            const ChangeSet& changes) const;

    TreeCodec codec_;
};

} // namespace chsync::tree
