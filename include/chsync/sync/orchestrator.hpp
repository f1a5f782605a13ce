#pragma once

/**
 * @file orchestrator.hpp
 * @brief Drives one incremental upload from local folder to index server
 *
 * STATES:
 * Validating   credential, channel permission, index server reachability
 * Scanning     local tree (TreeScanner)
 * Diffing      update mode only: fetch previous tree, diff and merge; a
 *              missing previous tree degrades to a fresh upload
 * Deleting     remote objects of removed and modified files (best effort)
 * Transferring pending files in scan order, per-file retry, identifiers
 *              written back into the merged tree
 * Persisting   merged tree to the index server
 *
 * CANCELLATION:
 * The token is checked between states, before every deletion and before
 * every transfer. Work already done stays done; the result reports
 * RunOutcome::Cancelled.
 *
 * FAILURE:
 * Only validation, scanning, diffing and persisting failures end the run.
 * A file that cannot be uploaded is recorded and the run moves on; it is
 * persisted without identifiers and retried by the next update run.
 */

#include "chsync/core/cancellation.hpp"
#include "chsync/core/config.hpp"
#include "chsync/events/observer.hpp"
#include "chsync/network/http_client.hpp"
#include "chsync/remote/retry_policy.hpp"
#include "chsync/remote/transfer_client.hpp"
#include "chsync/sync/session.hpp"
#include "chsync/sync/types.hpp"
#include "chsync/tree/types.hpp"

#include <string>

namespace chsync::sync {

class UploadOrchestrator {
public:
    UploadOrchestrator(network::HttpTransport& transfer_transport,
                       network::HttpTransport& index_transport,
                       Settings settings,
                       events::RunObserver& observer,
                       CancellationToken token,
                       remote::Sleeper& sleeper);

    /**
     * @brief Execute a full run; never throws for remote or local failures
     *
     * Both transports are closed before returning.
     */
    UploadResult run(const UploadRequest& request);

    const CancellationToken& token() const noexcept { return token_; }

private:
    struct RunContext;

    bool validate(RunContext& ctx);
    bool scan(RunContext& ctx);
    bool diff(RunContext& ctx);
    bool delete_obsolete(RunContext& ctx);
    bool transfer_pending(RunContext& ctx);
    bool persist(RunContext& ctx);

    remote::RemoteResult<remote::TransferReceipt> transfer_with_retry(RunContext& ctx,
                                                                      const tree::PathEntry& item);

    bool enter(RunContext& ctx, RunState next);
    bool check_cancelled(RunContext& ctx);
    void fail(RunContext& ctx, const std::string& message);

    void log(events::LogLevel level, const std::string& message);

    network::HttpTransport& transfer_transport_;
    network::HttpTransport& index_transport_;
    Settings settings_;
    events::RunObserver& observer_;
    CancellationToken token_;
    remote::Sleeper& sleeper_;
};

} // namespace chsync::sync
