#include "lfs/upload/chunked_uploader.hpp"
#include "lfs/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <thread>
#include <unordered_map>

namespace lfs::upload {
namespace {

// Errors from the /chunk endpoint that we should never try to continue on.
// not_joined, timeout, data_root_not_found and exceeds_disk_pool_size_limit
// are intermittent and retried like any transport failure.
constexpr std::array<const char*, 7> kFatalErrors = {
    "invalid_json",
    "chunk_too_big",
    "data_path_too_big",
    "offset_too_big",
    "data_size_too_big",
    "chunk_proof_ratio_not_attractive",
    "invalid_proof",
};

bool is_progressive(UploadState current, UploadState target) {
    static const std::unordered_map<UploadState, std::vector<UploadState>> transitions {
        {UploadState::NotStarted, {UploadState::HeaderPosted}},
        {UploadState::HeaderPosted, {UploadState::Uploading, UploadState::Complete}},
        {UploadState::Uploading, {UploadState::Complete}},
    };

    if (target == UploadState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

Result<EndpointReply, UploadFailure> accepted(EndpointReply reply) {
    return Result<EndpointReply, UploadFailure>(OkValue<EndpointReply>(std::move(reply)));
}

} // namespace

const char* to_string(UploadState state) {
    switch (state) {
        case UploadState::NotStarted: return "not_started";
        case UploadState::HeaderPosted: return "header_posted";
        case UploadState::Uploading: return "uploading";
        case UploadState::Complete: return "complete";
        case UploadState::Failed: return "failed";
    }
    return "unknown";
}

bool is_fatal_upload_error(const std::string& code) {
    return std::find(kFatalErrors.begin(), kFatalErrors.end(), code) != kFatalErrors.end();
}

Result<std::unique_ptr<ChunkedUploader>> ChunkedUploader::create(const SignedTransaction& transaction,
                                                                 ChunkEndpoint& endpoint,
                                                                 UploaderSettings settings,
                                                                 events::EventBus* bus) {
    if (!transaction.is_signed()) {
        return Err<std::unique_ptr<ChunkedUploader>>(ErrorKind::InvalidArgument, "Transaction is not signed");
    }
    if (!transaction.chunks) {
        return Err<std::unique_ptr<ChunkedUploader>>(ErrorKind::InvalidArgument, "Transaction chunks not prepared");
    }
    if (settings.retry.max_concurrent_chunks == 0) {
        return Err<std::unique_ptr<ChunkedUploader>>(ErrorKind::InvalidArgument,
                                                     "max_concurrent_chunks must be at least 1");
    }

    return Ok(std::unique_ptr<ChunkedUploader>(
        new ChunkedUploader(transaction, endpoint, std::move(settings), bus)));
}

ChunkedUploader::ChunkedUploader(const SignedTransaction& transaction,
                                 ChunkEndpoint& endpoint,
                                 UploaderSettings settings,
                                 events::EventBus* bus)
    : transaction_(transaction),
      endpoint_(endpoint),
      retry_(settings.retry),
      sleeper_(std::move(settings.sleeper)),
      bus_(bus),
      total_chunks_(transaction.chunk_count()),
      started_at_(std::chrono::steady_clock::now()),
      rng_(std::random_device{}()) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

Result<void, UploadFailure> ChunkedUploader::post_header() {
    {
        std::lock_guard lock(mutex_);
        if (failure_) {
            return Err<void>(*failure_);
        }
        if (header_posted_) {
            return Err<void>(UploadFailure{UploadPhase::Header, std::nullopt, ErrorKind::InvalidState,
                                           "Transaction header already posted"});
        }
    }

    started_at_ = std::chrono::steady_clock::now();
    const bool body_included = total_chunks_ <= kMaxChunksInBody;
    const std::string body = transaction_.header_json(body_included).dump();

    spdlog::info("Posting transaction {} header ({} chunk(s), data {})",
                 transaction_.id, total_chunks_, body_included ? "inline" : "in chunks");

    auto posted = post_with_retry(UploadPhase::Header, std::nullopt,
                                  [this, &body]() { return endpoint_.post_transaction(body); });
    if (posted.is_error()) {
        return fail(posted.error());
    }
    if (!posted.value().ok()) {
        // Not terminal: the caller may post the header again
        return Err<void>(UploadFailure{UploadPhase::Header, std::nullopt, ErrorKind::Network,
                                       posted.value().error_code});
    }

    {
        std::lock_guard lock(mutex_);
        auto moved = transition_to(UploadState::HeaderPosted);
        if (moved.is_error()) {
            return Err<void>(UploadFailure{UploadPhase::Header, std::nullopt, ErrorKind::InvalidState,
                                           moved.error().message});
        }
        header_posted_ = true;
        if (body_included) {
            uploaded_chunks_ = total_chunks_;
        } else {
            pending_.clear();
            for (std::size_t offset = 0; offset < total_chunks_; ++offset) {
                pending_.push_back(offset);
            }
            next_pending_ = 0;
        }
    }

    emit(events::TransactionHeaderPostedEvent{transaction_.id, total_chunks_, body_included});

    if (body_included) {
        {
            std::lock_guard lock(mutex_);
            auto moved = transition_to(UploadState::Complete);
            if (moved.is_error()) {
                return Err<void>(UploadFailure{UploadPhase::Header, std::nullopt, ErrorKind::InvalidState,
                                               moved.error().message});
            }
        }
        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at_);
        emit(events::UploadCompletedEvent{transaction_.id, total_chunks_, total_errors_.load(), duration});
    }
    return Ok<UploadFailure>();
}

Result<void, UploadFailure> ChunkedUploader::upload_chunks() {
    {
        std::lock_guard lock(mutex_);
        if (failure_) {
            return Err<void>(*failure_);
        }
        if (!header_posted_) {
            return Err<void>(UploadFailure{UploadPhase::Chunk, std::nullopt, ErrorKind::InvalidState,
                                           "Transaction header not posted"});
        }
        if (state_ == UploadState::Complete) {
            return Ok<UploadFailure>();
        }

        auto moved = transition_to(UploadState::Uploading);
        if (moved.is_error()) {
            return Err<void>(UploadFailure{UploadPhase::Chunk, std::nullopt, ErrorKind::InvalidState,
                                           moved.error().message});
        }

        // Offsets given up on by the previous pass get another chance
        if (next_pending_ >= pending_.size()) {
            pending_ = std::move(given_up_);
            given_up_.clear();
            std::sort(pending_.begin(), pending_.end());
            next_pending_ = 0;
        }
    }

    const std::size_t remaining = pending_.size() - next_pending_;
    const std::size_t worker_count = std::min(remaining, retry_.max_concurrent_chunks);
    spdlog::debug("Uploading {} chunk(s) of transaction {} with {} worker(s)",
                  remaining, transaction_.id, worker_count);

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back([this]() { run_worker(); });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::optional<UploadFailure> incomplete;
    {
        std::lock_guard lock(mutex_);
        if (failure_) {
            return Err<void>(*failure_);
        }

        if (!given_up_.empty()) {
            incomplete = UploadFailure{
                UploadPhase::Chunk,
                *std::min_element(given_up_.begin(), given_up_.end()),
                ErrorKind::Network,
                std::to_string(given_up_.size()) + " chunk(s) not accepted after retry"};
        } else {
            auto moved = transition_to(UploadState::Complete);
            if (moved.is_error()) {
                return Err<void>(UploadFailure{UploadPhase::Chunk, std::nullopt, ErrorKind::InvalidState,
                                               moved.error().message});
            }
        }
    }

    if (incomplete) {
        spdlog::warn("Transaction {}: {}", transaction_.id, incomplete->describe());
        return Err<void>(*incomplete);
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);
    spdlog::info("Transaction {} uploaded: {} chunk(s), {} error(s), {} ms",
                 transaction_.id, total_chunks_, total_errors_.load(), duration.count());
    emit(events::UploadCompletedEvent{transaction_.id, total_chunks_, total_errors_.load(), duration});
    return Ok<UploadFailure>();
}

Result<void, UploadFailure> ChunkedUploader::upload() {
    if (!header_posted_) {
        auto header = post_header();
        if (header.is_error()) {
            return header;
        }
    }
    return upload_chunks();
}

bool ChunkedUploader::is_complete() const noexcept {
    return header_posted_ && uploaded_chunks_.load() == total_chunks_;
}

int ChunkedUploader::pct_complete() const noexcept {
    if (total_chunks_ == 0) {
        return header_posted_ ? 100 : 0;
    }
    return static_cast<int>(uploaded_chunks_.load() * 100 / total_chunks_);
}

UploadState ChunkedUploader::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

void ChunkedUploader::run_worker() {
    while (!aborted_) {
        const std::size_t slot = next_pending_.fetch_add(1);
        if (slot >= pending_.size()) {
            return;
        }
        const std::size_t offset = pending_[slot];

        auto chunk = transaction_.chunk_json(offset);
        if (chunk.is_error()) {
            abort(UploadFailure{UploadPhase::Chunk, offset, chunk.error().kind, chunk.error().message});
            return;
        }
        const std::string body = chunk.value().dump();

        auto posted = post_with_retry(UploadPhase::Chunk, offset,
                                      [this, &body]() { return endpoint_.post_chunk(body); });
        if (posted.is_error()) {
            abort(posted.error());
            return;
        }
        if (!posted.value().ok()) {
            if (aborted_) {
                return;
            }
            std::lock_guard lock(mutex_);
            given_up_.push_back(offset);
            continue;
        }

        const std::size_t uploaded = ++uploaded_chunks_;
        emit(events::ChunkUploadedEvent{transaction_.id, offset, uploaded, total_chunks_,
                                        static_cast<int>(uploaded * 100 / total_chunks_)});
    }
}

Result<EndpointReply, UploadFailure> ChunkedUploader::post_with_retry(UploadPhase phase,
                                                                      std::optional<std::size_t> chunk_offset,
                                                                      const std::function<EndpointReply()>& post) {
    EndpointReply reply = post();
    if (reply.ok()) {
        return accepted(std::move(reply));
    }
    if (auto failure = classify(phase, chunk_offset, reply)) {
        return Err<EndpointReply>(std::move(*failure));
    }
    // Another worker already ended the upload
    if (aborted_) {
        return accepted(std::move(reply));
    }

    const auto delay = jittered_delay();
    const auto target = phase == UploadPhase::Header ? std::nullopt : chunk_offset;
    spdlog::warn("Transaction {}: {} failed ({}), retrying in {} ms",
                 transaction_.id, request_label(phase, target), reply.error_code, delay.count());
    emit(events::UploadRetryEvent{transaction_.id, phase, target, reply.error_code,
                                  total_errors_.load(), delay});
    sleeper_(delay);
    if (aborted_) {
        return accepted(std::move(reply));
    }

    reply = post();
    if (reply.ok()) {
        return accepted(std::move(reply));
    }
    if (auto failure = classify(phase, chunk_offset, reply)) {
        return Err<EndpointReply>(std::move(*failure));
    }
    return accepted(std::move(reply));
}

std::optional<UploadFailure> ChunkedUploader::classify(UploadPhase phase,
                                                       std::optional<std::size_t> chunk_offset,
                                                       const EndpointReply& reply) {
    const std::string code = reply.error_code.empty() ? "HTTP " + std::to_string(reply.status) : reply.error_code;

    if (is_fatal_upload_error(code)) {
        return UploadFailure{phase, chunk_offset, ErrorKind::FatalProtocol, code};
    }

    const std::size_t errors = ++total_errors_;
    if (errors >= retry_.max_errors) {
        return UploadFailure{phase, chunk_offset, ErrorKind::RetryBudgetExhausted, code};
    }
    return std::nullopt;
}

void ChunkedUploader::abort(UploadFailure failure) {
    bool first = false;
    {
        std::lock_guard lock(mutex_);
        if (!failure_) {
            failure_ = failure;
            first = true;
            state_ = UploadState::Failed;
        }
    }
    aborted_ = true;

    if (first) {
        spdlog::error("Transaction {}: {}", transaction_.id, failure.describe());
        emit(events::UploadFailedEvent{transaction_.id, std::move(failure)});
    }
}

Result<void, UploadFailure> ChunkedUploader::fail(UploadFailure failure) {
    abort(std::move(failure));
    std::lock_guard lock(mutex_);
    return Err<void>(*failure_);
}

Result<void> ChunkedUploader::transition_to(UploadState next) {
    if (state_ == next) {
        return Ok();
    }
    if (state_ == UploadState::Failed || state_ == UploadState::Complete || !is_progressive(state_, next)) {
        return Err<void>(ErrorKind::InvalidState,
                         std::string("Illegal upload state transition ") + to_string(state_) + " -> " + to_string(next));
    }
    state_ = next;
    return Ok();
}

std::chrono::milliseconds ChunkedUploader::jittered_delay() {
    const auto base = retry_.retry_delay.count();
    double reduction = 0.0;
    {
        std::lock_guard lock(mutex_);
        std::uniform_real_distribution<double> jitter(0.0, retry_.jitter_fraction);
        reduction = jitter(rng_);
    }
    return std::chrono::milliseconds(base - static_cast<std::chrono::milliseconds::rep>(base * reduction));
}

} // namespace lfs::upload
