#pragma once

#include "lfs/core/result.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace lfs::upload {

enum class UploadPhase {
    Header,  // POST /tx
    Chunk    // POST /chunk
};

inline const char* to_string(UploadPhase phase) {
    return phase == UploadPhase::Header ? "header" : "chunk";
}

/// "transaction header" or "chunk 12"; chunk offsets never appear for the header
inline std::string request_label(UploadPhase phase, std::optional<std::size_t> chunk_offset) {
    if (phase == UploadPhase::Header) {
        return "transaction header";
    }
    return chunk_offset ? "chunk " + std::to_string(*chunk_offset) : "chunks";
}

/**
 * @brief Why an upload attempt was abandoned
 *
 * Enough for an operator to tell a request that can never succeed
 * (FatalProtocol, e.g. "invalid_proof") from a network that stayed
 * unhealthy for too long (RetryBudgetExhausted).
 */
struct UploadFailure {
    UploadPhase phase = UploadPhase::Header;
    std::optional<std::size_t> chunk_offset;  ///< Set when phase == Chunk
    ErrorKind kind = ErrorKind::InvalidState;
    std::string code;                          ///< Gateway error code or transport message

    std::string describe() const {
        std::string text;
        if (kind == ErrorKind::FatalProtocol) {
            text = "Fatal error";
        } else if (kind == ErrorKind::RetryBudgetExhausted) {
            text = "Too many errors";
        } else {
            text = "Error";
        }
        if (phase == UploadPhase::Header) {
            text += " posting transaction header";
        } else if (chunk_offset) {
            text += " uploading chunk " + std::to_string(*chunk_offset);
        } else {
            text += " uploading chunks";
        }
        return text + ": " + code;
    }
};

} // namespace lfs::upload
