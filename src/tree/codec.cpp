#include "chsync/tree/codec.hpp"

#include <spdlog/fmt/fmt.h>

namespace chsync::tree {
namespace {

using nlohmann::json;

std::string describe(const std::string& path) {
    return path.empty() ? std::string("<root>") : path;
}

bool is_valid_leaf_name(const std::string& name) {
    return !name.empty() && name.size() <= kMaxNameLength && name.find('/') == std::string::npos;
}

} // namespace

TreeCodec::TreeCodec(CodecOptions options)
    : options_(options) {}

bool TreeCodec::is_valid_object_id(const std::string& object_id) const {
    if (object_id.size() < options_.min_object_id_length) {
        return false;
    }
    for (unsigned char c : object_id) {
        if (c <= 0x20 || c == 0x7f) {
            return false;
        }
    }
    return true;
}

Result<json> TreeCodec::serialize(const TreeNode& tree) const {
    return serialize_node(tree, "", 0);
}

Result<json> TreeCodec::serialize_node(const TreeNode& node, const std::string& path, std::size_t depth) const {
    if (depth > options_.max_depth) {
        return Err<json>(fmt::format("Tree depth exceeds {} levels at '{}'", options_.max_depth, describe(path)));
    }

    json files = json::array();
    for (const auto& file : node.files) {
        const auto file_path = join_path(path, file.name);

        if (!is_valid_utf8(file.name)) {
            return Err<json>("File name is not valid UTF-8 under '" + describe(path) + "'");
        }
        if (file.remote_object_id.has_value() != file.remote_message_id.has_value()) {
            return Err<json>("Incomplete remote identifiers for '" + file_path + "'");
        }

        json out = {
            {"fileName", file.name},
            {"fileSize", file.size},
            {"fileId", nullptr},
            {"messageId", nullptr},
        };

        if (file.has_remote_ids()) {
            if (!is_valid_object_id(*file.remote_object_id)) {
                return Err<json>("Invalid object id for '" + file_path + "'");
            }
            if (!is_valid_message_id(*file.remote_message_id)) {
                return Err<json>(fmt::format("Invalid message id {} for '{}'", *file.remote_message_id, file_path));
            }
            out["fileId"] = *file.remote_object_id;
            out["messageId"] = *file.remote_message_id;
        }
        files.push_back(std::move(out));
    }

    json subfolders = json::object();
    for (const auto& [name, child] : node.subfolders) {
        if (!is_valid_utf8(name)) {
            return Err<json>("Folder name is not valid UTF-8 under '" + describe(path) + "'");
        }
        auto encoded = serialize_node(child, join_path(path, name), depth + 1);
        if (encoded.is_error()) {
            return encoded;
        }
        subfolders[name] = std::move(encoded.value());
    }

    return Ok(json{{"files", std::move(files)}, {"subfolders", std::move(subfolders)}});
}

Result<TreeNode> TreeCodec::parse(const std::string& text) const {
    json exchange;
    try {
        exchange = json::parse(text);
    } catch (const json::parse_error& e) {
        return Err<TreeNode>(std::string("Invalid tree JSON: ") + e.what());
    }
    return deserialize(exchange);
}

Result<TreeNode> TreeCodec::deserialize(const json& exchange) const {
    return deserialize_node(exchange, "", 0);
}

Result<TreeNode> TreeCodec::deserialize_node(const json& node, const std::string& path, std::size_t depth) const {
    if (depth > options_.max_depth) {
        return Err<TreeNode>(fmt::format("Tree depth exceeds {} levels at '{}'", options_.max_depth, describe(path)));
    }
    if (!node.is_object()) {
        return Err<TreeNode>("Invalid tree format at '" + describe(path) + "': expected an object");
    }

    const auto files_it = node.find("files");
    const auto subfolders_it = node.find("subfolders");
    if (files_it == node.end() || subfolders_it == node.end()) {
        return Err<TreeNode>("Invalid tree format at '" + describe(path) + "': 'files' and 'subfolders' are required");
    }
    if (!files_it->is_array() || !subfolders_it->is_object()) {
        return Err<TreeNode>("Invalid tree format at '" + describe(path) + "': wrong type for 'files' or 'subfolders'");
    }

    TreeNode result;
    result.files.reserve(files_it->size());
    for (const auto& file : *files_it) {
        auto decoded = deserialize_file(file, path);
        if (decoded.is_error()) {
            return Err<TreeNode>(decoded.error());
        }
        result.files.push_back(std::move(decoded.value()));
    }

    for (const auto& [name, child] : subfolders_it->items()) {
        if (!is_valid_leaf_name(name)) {
            return Err<TreeNode>("Invalid folder name under '" + describe(path) + "'");
        }
        auto decoded = deserialize_node(child, join_path(path, name), depth + 1);
        if (decoded.is_error()) {
            return decoded;
        }
        result.subfolders.emplace(name, std::move(decoded.value()));
    }

    return Ok(std::move(result));
}

Result<FileEntry> TreeCodec::deserialize_file(const json& file, const std::string& path) const {
    if (!file.is_object()) {
        return Err<FileEntry>("Invalid file entry under '" + describe(path) + "': expected an object");
    }

    const auto name_it = file.find("fileName");
    if (name_it == file.end() || !name_it->is_string() || !is_valid_leaf_name(name_it->get<std::string>())) {
        return Err<FileEntry>("Invalid file entry under '" + describe(path) + "': bad 'fileName'");
    }

    FileEntry entry;
    entry.name = name_it->get<std::string>();
    const auto file_path = join_path(path, entry.name);

    // Trees persisted before sizes were recorded decode with size 0
    const auto size_it = file.find("fileSize");
    if (size_it != file.end() && !size_it->is_null()) {
        if (size_it->is_number_unsigned()) {
            entry.size = size_it->get<std::uint64_t>();
        } else if (size_it->is_number_integer() && size_it->get<std::int64_t>() >= 0) {
            entry.size = static_cast<std::uint64_t>(size_it->get<std::int64_t>());
        } else {
            return Err<FileEntry>("Invalid 'fileSize' for '" + file_path + "'");
        }
    }

    const auto id_it = file.find("fileId");
    const auto message_it = file.find("messageId");
    const bool has_id = id_it != file.end() && !id_it->is_null();
    const bool has_message = message_it != file.end() && !message_it->is_null();

    if (has_id != has_message) {
        return Err<FileEntry>("Incomplete remote identifiers for '" + file_path + "'");
    }

    if (has_id) {
        if (!id_it->is_string() || !message_it->is_number_integer()) {
            return Err<FileEntry>("Wrong identifier types for '" + file_path + "'");
        }
        auto object_id = id_it->get<std::string>();
        const auto message_id = message_it->get<std::int64_t>();
        if (!is_valid_object_id(object_id) || !is_valid_message_id(message_id)) {
            return Err<FileEntry>("Invalid remote identifiers for '" + file_path + "'");
        }
        entry.assign_remote_ids(std::move(object_id), message_id);
    }

    return Ok(std::move(entry));
}

Result<PathMap> TreeCodec::extract_path_map(const TreeNode& tree) const {
    auto entries = extract_entries(tree);
    if (entries.is_error()) {
        return Err<PathMap>(entries.error());
    }

    PathMap map;
    for (auto& item : entries.value()) {
        map[item.relative_path] = std::move(item.entry);
    }
    return Ok(std::move(map));
}

Result<std::vector<PathEntry>> TreeCodec::extract_entries(const TreeNode& tree) const {
    std::vector<PathEntry> out;
    auto collected = collect(tree, "", 0, out);
    if (collected.is_error()) {
        return Err<std::vector<PathEntry>>(collected.error());
    }
    return Ok(std::move(out));
}

Result<void> TreeCodec::collect(const TreeNode& node,
                                const std::string& prefix,
                                std::size_t depth,
                                std::vector<PathEntry>& out) const {
    if (depth > options_.max_depth) {
        return Err<void>(fmt::format("Tree depth exceeds {} levels at '{}'", options_.max_depth, describe(prefix)));
    }

    for (const auto& file : node.files) {
        out.push_back(PathEntry{join_path(prefix, file.name), file});
    }

    for (const auto& [name, child] : node.subfolders) {
        auto result = collect(child, join_path(prefix, name), depth + 1, out);
        if (result.is_error()) {
            return result;
        }
    }
    return Ok();
}

} // namespace chsync::tree
