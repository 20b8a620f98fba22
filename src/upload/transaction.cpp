#include "lfs/upload/transaction.hpp"
#include "lfs/core/encoding.hpp"

namespace lfs::upload {

nlohmann::json SignedTransaction::header_json(bool include_data) const {
    nlohmann::json tag_list = nlohmann::json::array();
    for (const auto& tag : tags) {
        tag_list.push_back({
            {"name", base64url_encode(tag.name)},
            {"value", base64url_encode(tag.value)},
        });
    }

    return {
        {"format", format},
        {"id", id},
        {"last_tx", last_tx},
        {"owner", owner},
        {"tags", tag_list},
        {"target", target},
        {"quantity", quantity},
        {"data", include_data ? base64url_encode(data) : std::string()},
        {"data_size", std::to_string(data_size)},
        {"data_root", data_root},
        {"data_tree", nlohmann::json::array()},
        {"reward", reward},
        {"signature", signature},
    };
}

Result<nlohmann::json> SignedTransaction::chunk_json(std::size_t index) const {
    if (!chunks) {
        return Err<nlohmann::json>(ErrorKind::InvalidState, "Transaction " + id + " has no chunk table");
    }
    if (index >= chunks->chunks.size() || index >= chunks->proofs.size()) {
        return Err<nlohmann::json>(ErrorKind::InvalidArgument,
                                   "Chunk " + std::to_string(index) + " out of range for transaction " + id);
    }

    const auto& chunk = chunks->chunks[index];
    const auto& proof = chunks->proofs[index];
    if (chunk.min_byte_range > chunk.max_byte_range || chunk.max_byte_range > data.size()) {
        return Err<nlohmann::json>(ErrorKind::InvalidArgument,
                                   "Chunk " + std::to_string(index) + " byte range lies outside the data");
    }

    const std::vector<std::uint8_t> slice(data.begin() + static_cast<std::ptrdiff_t>(chunk.min_byte_range),
                                          data.begin() + static_cast<std::ptrdiff_t>(chunk.max_byte_range));

    nlohmann::json body = {
        {"data_root", base64url_encode(chunks->data_root)},
        {"data_size", std::to_string(data_size)},
        {"data_path", base64url_encode(proof.proof)},
        {"offset", std::to_string(proof.offset)},
        {"chunk", base64url_encode(slice)},
    };
    return Ok(std::move(body));
}

} // namespace lfs::upload
