#include "chsync/tree/differ.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace chsync::tree {

TreeDiffer::TreeDiffer(CodecOptions options)
    : codec_(options) {}

Result<ChangeSet> TreeDiffer::diff(const TreeNode& previous, const TreeNode& current) const {
    auto previous_map = codec_.extract_path_map(previous);
    if (previous_map.is_error()) {
        return Err<ChangeSet>(previous_map.error());
    }
    auto current_map = codec_.extract_path_map(current);
    if (current_map.is_error()) {
        return Err<ChangeSet>(current_map.error());
    }

    const auto& before = previous_map.value();
    const auto& after = current_map.value();

    ChangeSet changes;
    changes.total_previous = before.size();
    changes.total_current = after.size();

    // Both maps are ordered by path; walk them side by side
    auto it_before = before.begin();
    auto it_after = after.begin();

    while (it_before != before.end() || it_after != after.end()) {
        if (it_after == after.end() || (it_before != before.end() && it_before->first < it_after->first)) {
            changes.removed.emplace(it_before->first, it_before->second);
            ++it_before;
            continue;
        }

        if (it_before == before.end() || it_after->first < it_before->first) {
            changes.added.emplace(it_after->first, it_after->second);
            ++it_after;
            continue;
        }

        if (it_before->second.size != it_after->second.size) {
            changes.modified.emplace(it_before->first, ModifiedFile{it_before->second, it_after->second});
        } else {
            changes.unchanged.emplace(it_before->first, it_before->second);
        }
        ++it_before;
        ++it_after;
    }

    return Ok(std::move(changes));
}

Result<TreeNode> TreeDiffer::merge_with_previous(const ChangeSet& changes, const TreeNode& current) const {
    TreeNode merged = current;
    auto result = merge_node(merged, "", 0, changes);
    if (result.is_error()) {
        return Err<TreeNode>(result.error());
    }
    return Ok(std::move(merged));
}

Result<void> TreeDiffer::merge_node(TreeNode& node,
                                    const std::string& prefix,
                                    std::size_t depth,
                                    const ChangeSet& changes) const {
    if (depth > codec_.options().max_depth) {
        return Err<void>(fmt::format("Tree depth exceeds {} levels at '{}'", codec_.options().max_depth, prefix));
    }

    for (auto& file : node.files) {
        file.clear_remote_ids();
        file.skip_transfer = false;

        const auto it = changes.unchanged.find(join_path(prefix, file.name));
        if (it != changes.unchanged.end() && it->second.has_remote_ids()) {
            file.assign_remote_ids(*it->second.remote_object_id, *it->second.remote_message_id);
            file.skip_transfer = true;
        }
    }

    for (auto& [name, child] : node.subfolders) {
        auto result = merge_node(child, join_path(prefix, name), depth + 1, changes);
        if (result.is_error()) {
            return result;
        }
    }
    return Ok();
}

Result<std::vector<PathEntry>> TreeDiffer::files_pending_transfer(const TreeNode& merged) const {
    auto entries = codec_.extract_entries(merged);
    if (entries.is_error()) {
        return entries;
    }

    std::vector<PathEntry> pending;
    for (auto& item : entries.value()) {
        if (!item.entry.skip_transfer) {
            pending.push_back(std::move(item));
        }
    }
    return Ok(std::move(pending));
}

std::vector<PathEntry> TreeDiffer::files_pending_deletion(const ChangeSet& changes) {
    std::vector<PathEntry> pending;
    pending.reserve(changes.removed.size() + changes.modified.size());
    for (const auto& [path, entry] : changes.removed) {
        pending.push_back(PathEntry{path, entry});
    }
    for (const auto& [path, modified] : changes.modified) {
        pending.push_back(PathEntry{path, modified.previous});
    }
    return pending;
}

double TreeDiffer::change_percentage(const ChangeSet& changes) noexcept {
    const auto denominator = std::max<std::size_t>({changes.total_previous, changes.total_current, 1});
    const double percentage = 100.0 * static_cast<double>(changes.changed_count()) / static_cast<double>(denominator);
    return std::clamp(percentage, 0.0, 100.0);
}

Result<void> TreeDiffer::assign_remote_ids(TreeNode& tree,
                                           const std::string& relative_path,
                                           const std::string& object_id,
                                           std::int64_t message_id) {
    TreeNode* node = &tree;
    std::string::size_type start = 0;

    while (true) {
        const auto slash = relative_path.find('/', start);
        if (slash == std::string::npos) {
            break;
        }
        const auto folder = relative_path.substr(start, slash - start);
        const auto it = node->subfolders.find(folder);
        if (it == node->subfolders.end()) {
            return Err<void>("Cannot record identifiers: no folder '" + folder + "' in path '" + relative_path + "'");
        }
        node = &it->second;
        start = slash + 1;
    }

    const auto leaf = relative_path.substr(start);
    const auto file = std::find_if(node->files.begin(), node->files.end(),
                                   [&](const FileEntry& candidate) { return candidate.name == leaf; });
    if (file == node->files.end()) {
        return Err<void>("Cannot record identifiers: no file at '" + relative_path + "'");
    }

    file->assign_remote_ids(object_id, message_id);
    file->skip_transfer = true;
    return Ok();
}

} // namespace chsync::tree
