#include "chsync/sync/orchestrator.hpp"

#include "chsync/remote/index_client.hpp"
#include "chsync/tree/differ.hpp"
#include "chsync/tree/scanner.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <utility>
#include <vector>

namespace chsync::sync {

using events::LogLevel;

struct UploadOrchestrator::RunContext {
    RunContext(const UploadRequest& req,
               const Settings& settings,
               network::HttpTransport& transfer_transport,
               network::HttpTransport& index_transport,
               remote::Sleeper& sleeper,
               const CancellationToken& token)
        : request(req)
        , session(req.mode)
        , retry(settings.retry, sleeper, token)
        , transfer(transfer_transport, retry, settings, req.credential)
        , index(index_transport, retry, settings)
        , differ(tree::CodecOptions{settings.max_tree_depth, settings.min_object_id_length}) {}

    const UploadRequest& request;
    UploadSession session;
    remote::RetryPolicy retry;
    remote::TransferClient transfer;
    remote::IndexClient index;
    tree::TreeDiffer differ;
    UploadResult result;
    std::string bot_username;
    tree::TreeNode merged;
    std::vector<tree::PathEntry> pending_delete;
};

namespace {

// Releases both HTTP connections on every exit path of a run
class TransportGuard {
public:
    TransportGuard(network::HttpTransport& first, network::HttpTransport& second)
        : first_(first), second_(second) {}

    ~TransportGuard() {
        first_.close();
        if (&second_ != &first_) {
            second_.close();
        }
    }

    TransportGuard(const TransportGuard&) = delete;
    TransportGuard& operator=(const TransportGuard&) = delete;

private:
    network::HttpTransport& first_;
    network::HttpTransport& second_;
};

} // namespace

UploadOrchestrator::UploadOrchestrator(network::HttpTransport& transfer_transport,
                                       network::HttpTransport& index_transport,
                                       Settings settings,
                                       events::RunObserver& observer,
                                       CancellationToken token,
                                       remote::Sleeper& sleeper)
    : transfer_transport_(transfer_transport)
    , index_transport_(index_transport)
    , settings_(std::move(settings))
    , observer_(observer)
    , token_(std::move(token))
    , sleeper_(sleeper) {}

UploadResult UploadOrchestrator::run(const UploadRequest& request) {
    TransportGuard guard(transfer_transport_, index_transport_);
    RunContext ctx(request, settings_, transfer_transport_, index_transport_, sleeper_, token_);

    const bool completed = validate(ctx) &&
                           scan(ctx) &&
                           diff(ctx) &&
                           delete_obsolete(ctx) &&
                           transfer_pending(ctx) &&
                           persist(ctx);

    if (completed && enter(ctx, RunState::Done)) {
        ctx.result.outcome = RunOutcome::Succeeded;
    }

    spdlog::debug("[Orchestrator] finished outcome={} uploaded={} skipped={} failed={} deleted={}",
                  to_string(ctx.result.outcome), ctx.result.files_uploaded, ctx.result.files_skipped,
                  ctx.result.files_failed, ctx.result.objects_deleted);
    observer_.on_run_finished(ctx.result);
    return ctx.result;
}

void UploadOrchestrator::log(LogLevel level, const std::string& message) {
    observer_.on_log(level, message);
}

bool UploadOrchestrator::enter(RunContext& ctx, RunState next) {
    const auto previous = ctx.session.state();
    auto transition = ctx.session.transition_to(next);
    if (transition.is_error()) {
        fail(ctx, transition.error());
        return false;
    }
    observer_.on_state_changed(previous, next);
    return true;
}

bool UploadOrchestrator::check_cancelled(RunContext& ctx) {
    if (!token_.is_cancelled()) {
        return false;
    }
    if (ctx.session.state() == RunState::Cancelled) {
        return true;
    }

    const auto previous = ctx.session.state();
    auto transition = ctx.session.mark_cancelled();
    if (transition.is_error()) {
        spdlog::debug("[Orchestrator] cancel ignored: {}", transition.error());
        return true;
    }
    observer_.on_state_changed(previous, RunState::Cancelled);

    ctx.result.outcome = RunOutcome::Cancelled;
    ctx.result.success = false;
    ctx.result.message = "Upload cancelled";
    log(LogLevel::Warning, "Upload cancelled");
    return true;
}

void UploadOrchestrator::fail(RunContext& ctx, const std::string& message) {
    ctx.result.outcome = RunOutcome::Failed;
    ctx.result.success = false;
    ctx.result.message = message;
    ctx.result.errors.push_back(message);
    log(LogLevel::Error, message);

    const auto previous = ctx.session.state();
    auto transition = ctx.session.mark_failed(message);
    if (transition.is_error()) {
        spdlog::debug("[Orchestrator] failure after terminal state: {}", transition.error());
        return;
    }
    observer_.on_state_changed(previous, RunState::Failed);
}

bool UploadOrchestrator::validate(RunContext& ctx) {
    if (check_cancelled(ctx) || !enter(ctx, RunState::Validating)) {
        return false;
    }

    const auto& request = ctx.request;
    if (!is_valid_credential(request.credential)) {
        fail(ctx, "Invalid bot token format");
        return false;
    }
    if (!is_valid_destination_id(request.destination_id)) {
        fail(ctx, "Invalid channel ID format. Use @channelname or -100XXXXXXXXXX");
        return false;
    }

    log(LogLevel::Info, "Validating bot token...");
    auto identity = ctx.transfer.validate_credential();
    if (identity.is_error()) {
        if (identity.error().kind == remote::ErrorKind::Cancelled) {
            check_cancelled(ctx);
        } else {
            fail(ctx, "Bot token rejected: " + identity.error().message);
        }
        return false;
    }
    ctx.bot_username = "@" + identity.value().username;
    log(LogLevel::Success, "Bot validated: " + ctx.bot_username);

    if (check_cancelled(ctx)) {
        return false;
    }

    log(LogLevel::Info, "Checking channel permissions...");
    auto access = ctx.transfer.check_destination_permission(request.destination_id);
    if (access.is_error()) {
        if (access.error().kind == remote::ErrorKind::Cancelled) {
            check_cancelled(ctx);
        } else {
            fail(ctx, access.error().message);
        }
        return false;
    }
    log(LogLevel::Success, fmt::format("Channel access confirmed: {} ({})",
                                       access.value().title.empty() ? request.destination_id : access.value().title,
                                       access.value().role));

    if (check_cancelled(ctx)) {
        return false;
    }

    log(LogLevel::Info, "Checking server connection...");
    auto probe = ctx.index.probe_connectivity();
    if (probe.is_error()) {
        if (probe.error().kind == remote::ErrorKind::Cancelled) {
            check_cancelled(ctx);
        } else {
            fail(ctx, "Cannot reach index server: " + probe.error().message);
        }
        return false;
    }
    log(LogLevel::Success, "Server online");
    return true;
}

bool UploadOrchestrator::scan(RunContext& ctx) {
    if (check_cancelled(ctx) || !enter(ctx, RunState::Scanning)) {
        return false;
    }

    log(LogLevel::Info, "Scanning directory...");
    tree::TreeScanner scanner(tree::ScanOptions{settings_.max_object_size, settings_.max_tree_depth});
    auto scanned = scanner.scan(ctx.request.root, &observer_);
    if (scanned.is_error()) {
        fail(ctx, "Failed to scan directory: " + scanned.error());
        return false;
    }

    const auto& summary = scanner.summary();
    log(LogLevel::Success, fmt::format("Found {} files in {} folders ({:.2f} MB)",
                                       summary.total_files, summary.total_folders, summary.total_megabytes()));
    if (summary.skipped_files > 0) {
        log(LogLevel::Warning, fmt::format("Skipped {} files", summary.skipped_files));
    }
    for (const auto& error : summary.errors) {
        log(LogLevel::Error, error);
        ctx.result.errors.push_back(error);
    }
    for (const auto& warning : summary.warnings) {
        log(LogLevel::Warning, warning);
        ctx.result.warnings.push_back(warning);
    }

    ctx.merged = std::move(scanned.value());
    return true;
}

bool UploadOrchestrator::diff(RunContext& ctx) {
    if (ctx.request.mode != UploadMode::Update) {
        return true;
    }
    if (check_cancelled(ctx) || !enter(ctx, RunState::Diffing)) {
        return false;
    }

    log(LogLevel::Info, "Update mode: fetching existing metadata...");
    auto previous = ctx.index.fetch_tree(ctx.request.credential);
    if (previous.is_error()) {
        const auto& error = previous.error();
        if (error.kind == remote::ErrorKind::NotFound) {
            log(LogLevel::Warning, "No existing metadata found, treating as new upload");
            return true;
        }
        if (error.kind == remote::ErrorKind::Cancelled) {
            check_cancelled(ctx);
        } else {
            fail(ctx, "Cannot fetch existing metadata: " + error.message);
        }
        return false;
    }
    log(LogLevel::Success, "Existing metadata retrieved");

    auto changes = ctx.differ.diff(previous.value(), ctx.merged);
    if (changes.is_error()) {
        fail(ctx, "Cannot compare with existing metadata: " + changes.error());
        return false;
    }

    const auto& change_set = changes.value();
    ctx.result.local_change_percentage = tree::TreeDiffer::change_percentage(change_set);
    log(LogLevel::Info, fmt::format("Changes detected: {} added, {} removed, {} modified, {} unchanged ({:.1f}% change)",
                                    change_set.added.size(), change_set.removed.size(),
                                    change_set.modified.size(), change_set.unchanged.size(),
                                    *ctx.result.local_change_percentage));

    auto merged = ctx.differ.merge_with_previous(change_set, ctx.merged);
    if (merged.is_error()) {
        fail(ctx, "Cannot merge with existing metadata: " + merged.error());
        return false;
    }

    ctx.merged = std::move(merged.value());
    ctx.pending_delete = tree::TreeDiffer::files_pending_deletion(change_set);
    return true;
}

bool UploadOrchestrator::delete_obsolete(RunContext& ctx) {
    if (check_cancelled(ctx) || !enter(ctx, RunState::Deleting)) {
        return false;
    }

    std::vector<const tree::PathEntry*> deletable;
    for (const auto& item : ctx.pending_delete) {
        if (item.entry.remote_message_id) {
            deletable.push_back(&item);
        }
    }
    if (deletable.empty()) {
        return true;
    }

    log(LogLevel::Info, fmt::format("Removing {} old files from channel...", deletable.size()));
    for (const auto* item : deletable) {
        if (check_cancelled(ctx)) {
            return false;
        }

        const auto message_id = *item->entry.remote_message_id;
        if (ctx.transfer.delete_object(ctx.request.destination_id, message_id)) {
            ctx.result.objects_deleted++;
            observer_.on_object_deleted(message_id);
        } else {
            const auto warning = "Could not remove old copy of " + item->relative_path;
            log(LogLevel::Warning, warning);
            ctx.result.warnings.push_back(warning);
        }
    }
    log(LogLevel::Success, fmt::format("Removed {} of {} old files", ctx.result.objects_deleted, deletable.size()));
    return true;
}

remote::RemoteResult<remote::TransferReceipt> UploadOrchestrator::transfer_with_retry(RunContext& ctx,
                                                                                      const tree::PathEntry& item) {
    const int attempts = std::max(1, settings_.per_file_attempts);

    for (int attempt = 0;; ++attempt) {
        if (token_.is_cancelled()) {
            return Err<remote::TransferReceipt>(remote::RemoteError::cancelled());
        }

        auto result = ctx.transfer.transfer_object(ctx.request.destination_id, item.entry.local_path);
        if (result.is_ok() || !result.error().is_retryable() || attempt + 1 >= attempts) {
            return result;
        }

        std::chrono::seconds wait = settings_.per_file_backoff * (attempt + 1);
        if (result.error().kind == remote::ErrorKind::RateLimited && result.error().retry_after.count() > 0) {
            wait = std::min(result.error().retry_after, remote::kMaxRateLimitWait);
            log(LogLevel::Warning, fmt::format("Rate limited, waiting {}s...", wait.count()));
        } else {
            log(LogLevel::Warning, fmt::format("Upload failed, retrying in {}s...", wait.count()));
        }

        if (!sleeper_.sleep_for(std::chrono::duration_cast<std::chrono::milliseconds>(wait), token_)) {
            return Err<remote::TransferReceipt>(remote::RemoteError::cancelled());
        }
    }
}

bool UploadOrchestrator::transfer_pending(RunContext& ctx) {
    if (check_cancelled(ctx)) {
        return false;
    }

    auto all_files = ctx.index.codec().extract_entries(ctx.merged);
    auto pending = ctx.differ.files_pending_transfer(ctx.merged);
    if (all_files.is_error() || pending.is_error()) {
        fail(ctx, all_files.is_error() ? all_files.error() : pending.error());
        return false;
    }
    ctx.result.files_skipped = all_files.value().size() - pending.value().size();

    if (!enter(ctx, RunState::Transferring)) {
        return false;
    }

    const auto& files = pending.value();
    if (files.empty()) {
        log(LogLevel::Info, "No new files to upload");
        return true;
    }

    log(LogLevel::Info, fmt::format("Uploading {} files...", files.size()));
    for (std::size_t index = 0; index < files.size(); ++index) {
        if (check_cancelled(ctx)) {
            return false;
        }

        const auto& item = files[index];
        observer_.on_progress(index + 1, files.size(), "Uploading: " + item.entry.name);
        log(LogLevel::Info, fmt::format("[{}/{}] Uploading: {}", index + 1, files.size(), item.relative_path));

        auto receipt = transfer_with_retry(ctx, item);
        if (receipt.is_error()) {
            if (receipt.error().kind == remote::ErrorKind::Cancelled) {
                check_cancelled(ctx);
                return false;
            }
            const auto message = "Failed to upload " + item.relative_path + ": " + receipt.error().message;
            log(LogLevel::Error, message);
            ctx.result.errors.push_back(message);
            ctx.result.failed_paths.push_back(item.relative_path);
            ctx.result.files_failed++;
            observer_.on_object_failed(item.relative_path, receipt.error().message);
            continue;
        }

        auto recorded = tree::TreeDiffer::assign_remote_ids(ctx.merged, item.relative_path,
                                                            receipt.value().object_id, receipt.value().message_id);
        if (recorded.is_error()) {
            fail(ctx, recorded.error());
            return false;
        }
        ctx.result.files_uploaded++;
        observer_.on_object_transferred(item.relative_path, item.entry.size);
    }

    if (ctx.result.files_failed > 0) {
        log(LogLevel::Warning, fmt::format("Uploaded {} files, {} failed", ctx.result.files_uploaded,
                                           ctx.result.files_failed));
    } else {
        log(LogLevel::Success, fmt::format("Uploaded {} files", ctx.result.files_uploaded));
    }
    return true;
}

bool UploadOrchestrator::persist(RunContext& ctx) {
    if (check_cancelled(ctx) || !enter(ctx, RunState::Persisting)) {
        return false;
    }

    log(LogLevel::Info, "Sending metadata to server...");
    auto receipt = ctx.index.persist_tree(ctx.request.credential, ctx.request.destination_id,
                                          ctx.bot_username, ctx.merged);
    if (receipt.is_error()) {
        const auto& error = receipt.error();
        if (error.kind == remote::ErrorKind::Cancelled) {
            check_cancelled(ctx);
            return false;
        }
        fail(ctx, "Server error: " + error.message);
        for (const auto& detail : error.details) {
            log(LogLevel::Error, "  - " + detail);
            ctx.result.errors.push_back(detail);
        }
        return false;
    }

    const auto& accepted = receipt.value();
    ctx.result.success = true;
    ctx.result.assigned_id = accepted.assigned_id;
    ctx.result.status = accepted.status;
    ctx.result.message = accepted.message.empty() ? std::string("Upload completed successfully!") : accepted.message;
    if (accepted.is_update) {
        ctx.result.change_percentage = accepted.change_percentage.value_or(0.0);
    }

    log(LogLevel::Success, ctx.result.message);
    log(LogLevel::Info, "Bot ID: " + accepted.assigned_id);
    log(LogLevel::Info, "Status: " + accepted.status);
    if (ctx.result.change_percentage) {
        log(LogLevel::Info, fmt::format("Change percentage: {:.1f}%", *ctx.result.change_percentage));
    }
    return true;
}

} // namespace chsync::sync
