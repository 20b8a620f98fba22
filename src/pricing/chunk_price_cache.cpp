#include "lfs/pricing/chunk_price_cache.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>

namespace lfs::pricing {

Result<Winston> ChunkPriceCache::get_or_fetch(std::uint64_t chunk_count, const Fetch& fetch) {
    std::promise<Result<Winston>> promise;
    std::optional<std::shared_future<Result<Winston>>> pending;
    {
        std::lock_guard lock(mutex_);
        if (const auto hit = prices_.find(chunk_count); hit != prices_.end()) {
            return Ok(hit->second);
        }
        if (const auto running = in_flight_.find(chunk_count); running != in_flight_.end()) {
            pending = running->second;
        } else {
            in_flight_.emplace(chunk_count, promise.get_future().share());
        }
    }

    if (pending) {
        return pending->get();
    }

    Result<Winston> result = Err<Winston>(ErrorKind::InvalidState, "Price fetch did not run");
    try {
        result = fetch();
    } catch (const std::exception& e) {
        spdlog::warn("Price fetch for {} chunk(s) threw: {}", chunk_count, e.what());
        result = Err<Winston>(ErrorKind::InvalidState, std::string("Price fetch threw: ") + e.what());
    } catch (...) {
        // Waiters get the same exception; the key stays fetchable
        {
            std::lock_guard lock(mutex_);
            in_flight_.erase(chunk_count);
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::lock_guard lock(mutex_);
        if (result.is_ok()) {
            prices_.emplace(chunk_count, result.value());
        }
        in_flight_.erase(chunk_count);
    }
    promise.set_value(result);
    return result;
}

std::optional<Winston> ChunkPriceCache::find(std::uint64_t chunk_count) const {
    std::lock_guard lock(mutex_);
    const auto it = prices_.find(chunk_count);
    if (it == prices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ChunkPriceCache::contains(std::uint64_t chunk_count) const {
    std::lock_guard lock(mutex_);
    return prices_.count(chunk_count) > 0;
}

std::size_t ChunkPriceCache::size() const {
    std::lock_guard lock(mutex_);
    return prices_.size();
}

} // namespace lfs::pricing
