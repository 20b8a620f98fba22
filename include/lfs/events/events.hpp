/**
 * @file events.hpp
 * @brief Upload progress events
 *
 * NAMING CONVENTION:
 * Events are past-tense: ChunkUploadedEvent, UploadFailedEvent
 *
 * All events carry the transaction id so that one bus can serve several
 * uploads running side by side.
 */

#pragma once

#include "lfs/upload/upload_failure.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace lfs::events {

/**
 * @brief Emitted once the /tx header post has been accepted
 *
 * body_included is true for single-chunk payloads whose data travelled
 * inline with the header; such uploads need no /chunk posts.
 */
struct TransactionHeaderPostedEvent {
    std::string transaction_id;
    std::size_t total_chunks = 0;
    bool body_included = false;
};

struct ChunkUploadedEvent {
    std::string transaction_id;
    std::size_t chunk_offset = 0;
    std::size_t uploaded_chunks = 0;
    std::size_t total_chunks = 0;
    int pct_complete = 0;
};

/**
 * @brief Emitted before the jittered wait that precedes a retry
 */
struct UploadRetryEvent {
    std::string transaction_id;
    upload::UploadPhase phase = upload::UploadPhase::Chunk;
    std::optional<std::size_t> chunk_offset;  ///< Empty for the header
    std::string error_code;
    std::size_t total_errors = 0;
    std::chrono::milliseconds delay{0};
};

struct UploadFailedEvent {
    std::string transaction_id;
    upload::UploadFailure failure;
};

struct UploadCompletedEvent {
    std::string transaction_id;
    std::size_t total_chunks = 0;
    std::size_t total_errors = 0;
    std::chrono::milliseconds duration{0};
};

} // namespace lfs::events
