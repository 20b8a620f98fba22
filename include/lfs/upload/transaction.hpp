#pragma once

#include "lfs/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lfs::upload {

struct Tag {
    std::string name;
    std::string value;
};

/**
 * @brief Byte range [min_byte_range, max_byte_range) of the data and its hash
 */
struct TransactionChunk {
    std::uint64_t min_byte_range = 0;
    std::uint64_t max_byte_range = 0;
    std::vector<std::uint8_t> data_hash;
};

/**
 * @brief Merkle inclusion proof of one chunk below the data root
 */
struct TransactionProof {
    std::uint64_t offset = 0;
    std::vector<std::uint8_t> proof;
};

/**
 * @brief Chunking of the transaction data, prepared when the tx was built
 *
 * chunks[i] and proofs[i] describe the same chunk.
 */
struct ChunkTable {
    std::vector<std::uint8_t> data_root;
    std::vector<TransactionChunk> chunks;
    std::vector<TransactionProof> proofs;
};

/**
 * @brief A format-2 ledger transaction that has already been signed
 *
 * Building, chunking and signing happen elsewhere; this type only carries
 * the result and knows how to present it to the gateway's /tx and /chunk
 * endpoints. Plain-text fields (id, owner, data_root, signature, ...) are
 * expected to be base64url already; tags and data are raw and encoded on
 * output.
 */
struct SignedTransaction {
    int format = 2;
    std::string id;
    std::string last_tx;
    std::string owner;
    std::vector<Tag> tags;
    std::string target;
    std::string quantity = "0";
    std::vector<std::uint8_t> data;
    std::uint64_t data_size = 0;
    std::string data_root;
    std::string reward = "0";
    std::string signature;
    std::optional<ChunkTable> chunks;

    bool is_signed() const { return !id.empty(); }

    std::size_t chunk_count() const { return chunks ? chunks->chunks.size() : 0; }

    /**
     * @brief Body for POST /tx
     *
     * With include_data=false the "data" field is empty and the data is
     * expected to follow through /chunk; data_size and data_root still
     * describe the full payload.
     */
    nlohmann::json header_json(bool include_data) const;

    /**
     * @brief Body for POST /chunk of chunk `index`
     *
     * {data_root, data_size, data_path, offset, chunk}; fails when the
     * chunk table has no such chunk or the range falls outside the data.
     */
    Result<nlohmann::json> chunk_json(std::size_t index) const;
};

} // namespace lfs::upload
