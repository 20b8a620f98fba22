#pragma once

#include "lfs/core/config.hpp"
#include "lfs/core/result.hpp"
#include "lfs/events/event_bus.hpp"
#include "lfs/upload/chunk_endpoint.hpp"
#include "lfs/upload/transaction.hpp"
#include "lfs/upload/upload_failure.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace lfs::upload {

/// Payloads of at most this many chunks travel inline with the /tx header
inline constexpr std::size_t kMaxChunksInBody = 1;

enum class UploadState {
    NotStarted,
    HeaderPosted,
    Uploading,
    Complete,
    Failed
};

const char* to_string(UploadState state);

using Sleeper = std::function<void(std::chrono::milliseconds)>;

struct UploaderSettings {
    RetrySettings retry;
    Sleeper sleeper;  ///< Defaults to std::this_thread::sleep_for
};

/**
 * @brief Gateway error codes that no amount of retrying will fix
 */
bool is_fatal_upload_error(const std::string& code);

/**
 * @brief Posts a signed transaction header, then its chunks, to a gateway
 *
 * PROTOCOL:
 * 1. POST /tx. Payloads of at most kMaxChunksInBody chunks carry their data
 *    inline and are complete once the header is accepted.
 * 2. POST /chunk for every remaining chunk, from up to
 *    max_concurrent_chunks worker threads that claim offsets atomically.
 *
 * RETRY POLICY (per request):
 * - Fatal gateway code (see is_fatal_upload_error): abort the whole upload.
 * - Anything else, transport failures included: count it against the shared
 *   error budget. Reaching max_errors aborts the upload; otherwise wait
 *   retry_delay minus up to jitter_fraction of it and send the same request
 *   once more. A second failure is classified the same way but not retried
 *   again; the chunk stays pending for the next upload_chunks() call.
 *
 * STATE MACHINE:
 * NotStarted -> HeaderPosted -> Uploading -> Complete
 * Any state except Complete -> Failed (absorbing)
 *
 * There is no cancellation: discard the uploader to give up. Requests
 * already on the wire may still land.
 */
class ChunkedUploader {
public:
    /// The transaction is borrowed and must outlive the uploader
    static Result<std::unique_ptr<ChunkedUploader>> create(const SignedTransaction& transaction,
                                                           ChunkEndpoint& endpoint,
                                                           UploaderSettings settings = {},
                                                           events::EventBus* bus = nullptr);

    ChunkedUploader(const ChunkedUploader&) = delete;
    ChunkedUploader& operator=(const ChunkedUploader&) = delete;

    Result<void, UploadFailure> post_header();

    /**
     * @brief Upload every chunk that is still pending
     *
     * Requires the header to be posted. Returns once all workers have
     * stopped; a Network failure means some chunks were given up after
     * their retry and a later call will try them again.
     */
    Result<void, UploadFailure> upload_chunks();

    /// post_header() when needed, then upload_chunks()
    Result<void, UploadFailure> upload();

    [[nodiscard]] bool is_complete() const noexcept;
    [[nodiscard]] int pct_complete() const noexcept;
    [[nodiscard]] std::size_t total_chunks() const noexcept { return total_chunks_; }
    [[nodiscard]] std::size_t uploaded_chunks() const noexcept { return uploaded_chunks_.load(); }
    [[nodiscard]] std::size_t total_errors() const noexcept { return total_errors_.load(); }
    [[nodiscard]] UploadState state() const;
    [[nodiscard]] const std::string& transaction_id() const noexcept { return transaction_.id; }

private:
    ChunkedUploader(const SignedTransaction& transaction,
                    ChunkEndpoint& endpoint,
                    UploaderSettings settings,
                    events::EventBus* bus);

    // Ok with the last reply (accepted, or refused again on its single
    // retry), Err when the upload has to be abandoned.
    Result<EndpointReply, UploadFailure> post_with_retry(UploadPhase phase,
                                                std::optional<std::size_t> chunk_offset,
                                                const std::function<EndpointReply()>& post);

    // Failure to return when `reply` ends the upload, nullopt when the
    // request may be attempted again.
    std::optional<UploadFailure> classify(UploadPhase phase,
                                          std::optional<std::size_t> chunk_offset,
                                          const EndpointReply& reply);

    void run_worker();
    void abort(UploadFailure failure);
    Result<void, UploadFailure> fail(UploadFailure failure);
    Result<void> transition_to(UploadState next);  // Caller holds mutex_
    std::chrono::milliseconds jittered_delay();

    template<typename EventType>
    void emit(const EventType& event) {
        if (bus_) {
            bus_->emit(event);
        }
    }

    const SignedTransaction& transaction_;
    ChunkEndpoint& endpoint_;
    RetrySettings retry_;
    Sleeper sleeper_;
    events::EventBus* bus_;

    std::size_t total_chunks_;
    std::atomic<bool> header_posted_{false};
    std::chrono::steady_clock::time_point started_at_;

    // Offsets not yet accepted by the gateway; workers claim pending_[next_pending_++]
    std::vector<std::size_t> pending_;
    std::atomic<std::size_t> next_pending_{0};
    std::vector<std::size_t> given_up_;

    std::atomic<std::size_t> uploaded_chunks_{0};
    std::atomic<std::size_t> total_errors_{0};
    std::atomic<bool> aborted_{false};
    std::optional<UploadFailure> failure_;

    UploadState state_ = UploadState::NotStarted;
    mutable std::mutex mutex_;  // state_, failure_, given_up_, rng_

    std::mt19937 rng_;
};

} // namespace lfs::upload
