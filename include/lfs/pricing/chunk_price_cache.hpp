#pragma once

#include "lfs/core/result.hpp"
#include "lfs/core/types.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace lfs::pricing {

/**
 * @brief Prices keyed by chunk count, shared by every estimator that is handed it
 *
 * - Entries never expire; a price sampled once holds for the process lifetime.
 * - Concurrent misses on the same key are coalesced: the first caller runs
 *   the fetch, later callers wait on its shared future and receive the same
 *   result.
 * - Failed fetches are handed to the callers that were waiting but never
 *   stored, so the next lookup fetches again.
 * - A fetch that throws a std::exception counts as a failed fetch
 *   (ErrorKind::InvalidState). Other exceptions reach the caller and every
 *   waiter, and the key can still be fetched afterwards.
 */
class ChunkPriceCache {
public:
    using Fetch = std::function<Result<Winston>()>;

    ChunkPriceCache() = default;
    ChunkPriceCache(const ChunkPriceCache&) = delete;
    ChunkPriceCache& operator=(const ChunkPriceCache&) = delete;

    Result<Winston> get_or_fetch(std::uint64_t chunk_count, const Fetch& fetch);

    std::optional<Winston> find(std::uint64_t chunk_count) const;

    bool contains(std::uint64_t chunk_count) const;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, Winston> prices_;
    std::unordered_map<std::uint64_t, std::shared_future<Result<Winston>>> in_flight_;
};

} // namespace lfs::pricing
