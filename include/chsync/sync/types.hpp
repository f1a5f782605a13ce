#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chsync::sync {

/**
 * @brief States of one upload run
 *
 * Linear: Validating → Scanning → Diffing (update mode only) → Deleting →
 * Transferring → Persisting → Done. Cancelled and Failed are reachable from
 * every non-terminal state.
 */
enum class RunState {
    Idle,
    Validating,
    Scanning,
    Diffing,
    Deleting,
    Transferring,
    Persisting,
    Done,
    Cancelled,
    Failed
};

const char* to_string(RunState state) noexcept;

enum class UploadMode {
    Fresh,   ///< Upload every scanned file
    Update   ///< Diff against the index server's tree, upload only changes
};

enum class RunOutcome {
    Succeeded,
    Failed,
    Cancelled
};

const char* to_string(RunOutcome outcome) noexcept;

/**
 * @brief Inputs of one run
 */
struct UploadRequest {
    std::string credential;
    std::string destination_id;
    std::filesystem::path root;
    UploadMode mode = UploadMode::Fresh;
};

/**
 * @brief Terminal report of one run
 */
struct UploadResult {
    RunOutcome outcome = RunOutcome::Failed;
    bool success = false;
    std::string message;
    std::optional<std::string> assigned_id;   ///< Index server's id for this tree
    std::string status;                       ///< Index server's status string
    std::optional<double> change_percentage;  ///< Server-reported, update runs only
    std::optional<double> local_change_percentage;  ///< Local diff against the stored tree
    std::size_t files_uploaded = 0;
    std::size_t files_skipped = 0;
    std::size_t files_failed = 0;
    std::size_t objects_deleted = 0;
    std::vector<std::string> failed_paths;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

} // namespace chsync::sync
