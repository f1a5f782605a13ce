#include "chsync/tree/scanner.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace chsync::tree {
namespace {

bool is_blank(const std::string& name) {
    return std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

bool has_control_character(const std::string& name) {
    return std::any_of(name.begin(), name.end(), [](unsigned char c) { return c < 0x20 || c == 0x7f; });
}

bool has_traversal(const std::string& name) {
    return name.find("..") != std::string::npos ||
           name.find('/') != std::string::npos ||
           name.find('\\') != std::string::npos;
}

// Substrings that would be dangerous if the name is later rendered as markup
// or interpolated into a script or template.
bool has_injection_pattern(const std::string& name) {
    static const std::array<std::regex, 6> patterns = {
        std::regex(R"(<script)", std::regex::icase),
        std::regex(R"(javascript:)", std::regex::icase),
        std::regex(R"(on\w+\s*=)", std::regex::icase),
        std::regex(R"(\.\.[\\/])"),
        std::regex(R"(__proto__)", std::regex::icase),
        std::regex(R"(\$\{.*\})"),
    };
    return std::any_of(patterns.begin(), patterns.end(),
                       [&](const std::regex& pattern) { return std::regex_search(name, pattern); });
}

bool has_reserved_character(const std::string& name) {
    return name.find_first_of("<>:\"|?*") != std::string::npos;
}

struct DirectoryListing {
    std::vector<fs::directory_entry> entries;
    std::error_code error;
};

DirectoryListing list_sorted(const fs::path& folder) {
    DirectoryListing listing;
    fs::directory_iterator it(folder, listing.error);
    if (listing.error) {
        return listing;
    }
    for (const fs::directory_iterator end; it != end; it.increment(listing.error)) {
        if (listing.error) {
            return listing;
        }
        listing.entries.push_back(*it);
    }
    std::sort(listing.entries.begin(), listing.entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return name_less(a.path().filename().string(), b.path().filename().string());
              });
    return listing;
}

} // namespace

TreeScanner::TreeScanner(ScanOptions options)
    : options_(options) {}

std::optional<std::string> TreeScanner::validate_folder_name(const std::string& name) {
    if (name.empty() || is_blank(name)) {
        return std::string("Folder name is empty");
    }
    if (name.size() > kMaxNameLength) {
        return fmt::format("Folder name too long ({} > {} chars)", name.size(), kMaxNameLength);
    }
    if (has_traversal(name)) {
        return std::string("Path traversal characters not allowed");
    }
    if (!is_valid_utf8(name)) {
        return std::string("Folder name is not valid UTF-8");
    }
    if (has_injection_pattern(name)) {
        return std::string("Potentially dangerous characters detected");
    }
    if (has_control_character(name) || has_reserved_character(name)) {
        return std::string("Invalid characters in folder name");
    }
    return std::nullopt;
}

std::optional<std::string> TreeScanner::validate_file_name(const std::string& name) {
    if (name.empty() || is_blank(name)) {
        return std::string("File name is empty");
    }
    if (name.size() > kMaxNameLength) {
        return fmt::format("File name too long ({} > {} chars)", name.size(), kMaxNameLength);
    }
    if (has_traversal(name)) {
        return std::string("Path traversal characters not allowed");
    }
    if (!is_valid_utf8(name)) {
        return std::string("File name is not valid UTF-8");
    }
    if (has_control_character(name)) {
        return std::string("Control characters not allowed");
    }
    return std::nullopt;
}

Result<TreeNode> TreeScanner::scan(const fs::path& root, events::RunObserver* observer) {
    summary_ = ScanSummary{};
    observer_ = observer;
    processed_ = 0;
    total_ = 0;

    std::error_code ec;
    if (root.empty() || !fs::exists(root, ec)) {
        summary_.errors.push_back("Directory not found: " + root.string());
        return Err<TreeNode>(summary_.errors.back());
    }
    if (!fs::is_directory(root, ec)) {
        summary_.errors.push_back("Not a directory: " + root.string());
        return Err<TreeNode>(summary_.errors.back());
    }

    // First pass so progress is reported against a fixed total
    total_ = count_entries(root, 0);

    TreeNode tree;
    scan_folder(root, 0, tree);

    if (observer_ && total_ > 0 && processed_ < total_) {
        observer_->on_progress(total_, total_, "Scan complete");
    }

    spdlog::debug("[Scanner] root={} files={} folders={} bytes={} errors={} warnings={}",
                  root.string(), summary_.total_files, summary_.total_folders, summary_.total_bytes,
                  summary_.errors.size(), summary_.warnings.size());
    observer_ = nullptr;
    return Ok(std::move(tree));
}

void TreeScanner::scan_folder(const fs::path& folder, std::size_t depth, TreeNode& out) {
    auto listing = list_sorted(folder);
    if (listing.error) {
        if (listing.error == std::errc::permission_denied) {
            summary_.errors.push_back("Permission denied: " + folder.string());
        } else {
            summary_.errors.push_back("Error reading " + folder.string() + ": " + listing.error.message());
        }
        return;
    }

    for (const auto& entry : listing.entries) {
        const std::string name = entry.path().filename().string();
        report_progress("Scanning: " + name);

        std::error_code ec;
        if (entry.is_symlink(ec) && entry.is_directory(ec)) {
            summary_.warnings.push_back("Skipping symbolic link to folder: " + name);
            continue;
        }
        if (entry.is_directory(ec)) {
            if (auto reason = validate_folder_name(name)) {
                summary_.errors.push_back("Invalid folder '" + name + "': " + *reason);
                continue;
            }
            if (depth + 1 > options_.max_depth) {
                summary_.errors.push_back(fmt::format("Folder nesting exceeds {} levels: {}",
                                                      options_.max_depth, entry.path().string()));
                continue;
            }

            summary_.total_folders++;
            auto& child = out.subfolders[name];
            scan_folder(entry.path(), depth + 1, child);
        } else if (entry.is_regular_file(ec)) {
            visit_file(entry.path(), name, out);
        } else {
            spdlog::debug("[Scanner] ignoring special file {}", entry.path().string());
        }
    }
}

void TreeScanner::visit_file(const fs::path& path, const std::string& name, TreeNode& out) {
    if (auto reason = validate_file_name(name)) {
        summary_.warnings.push_back("Skipping file '" + name + "': " + *reason);
        summary_.skipped_files++;
        return;
    }

    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        summary_.warnings.push_back("Cannot read file size: " + name);
        summary_.skipped_files++;
        return;
    }

    if (size > options_.max_object_size) {
        constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;
        summary_.warnings.push_back(fmt::format("Skipping '{}': exceeds {:.2f}GB limit ({:.2f}GB)",
                                                name,
                                                static_cast<double>(options_.max_object_size) / kGiB,
                                                static_cast<double>(size) / kGiB));
        summary_.skipped_files++;
        return;
    }

    if (size == 0) {
        summary_.warnings.push_back("Skipping empty file: " + name);
        summary_.skipped_files++;
        return;
    }

    FileEntry file;
    file.name = name;
    file.size = size;
    file.local_path = path;
    out.files.push_back(std::move(file));

    summary_.total_files++;
    summary_.total_bytes += size;
}

std::size_t TreeScanner::count_entries(const fs::path& folder, std::size_t depth) const {
    auto listing = list_sorted(folder);
    if (listing.error) {
        return 0;
    }

    std::size_t count = listing.entries.size();
    for (const auto& entry : listing.entries) {
        std::error_code ec;
        if (!entry.is_symlink(ec) && entry.is_directory(ec) && depth + 1 <= options_.max_depth) {
            count += count_entries(entry.path(), depth + 1);
        }
    }
    return count;
}

void TreeScanner::report_progress(const std::string& label) {
    processed_++;
    // The tree may grow between the two passes; keep progress bounded
    total_ = std::max(total_, processed_);
    if (observer_) {
        observer_->on_progress(processed_, total_, label);
    }
}

} // namespace chsync::tree
