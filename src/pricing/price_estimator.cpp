#include "lfs/pricing/price_estimator.hpp"

#include <spdlog/spdlog.h>

#include <limits>

namespace lfs::pricing {

ArDataPriceEstimator::ArDataPriceEstimator(PriceOracle& oracle, ChunkPriceCache& cache)
    : oracle_(oracle),
      cache_(cache) {
}

Result<Winston> ArDataPriceEstimator::get_base_price(ByteCount bytes) {
    const std::uint64_t chunks = chunk_count(bytes);

    return cache_.get_or_fetch(chunks, [this, bytes, chunks]() {
        spdlog::debug("Price cache miss for {} chunk(s), querying oracle with {} bytes", chunks, bytes.value());
        auto price = oracle_.price_for_byte_count(bytes);
        if (price.is_error()) {
            spdlog::warn("Price oracle failed for {} bytes: {}", bytes.value(), price.error().describe());
        }
        return price;
    });
}

Result<ByteCount> ArDataPriceEstimator::get_byte_count_for_price(const Winston& amount) {
    auto base_price = get_base_price(ByteCount(0));
    if (base_price.is_error()) {
        return base_price.propagate<ByteCount>();
    }
    auto one_chunk_price = get_base_price(ByteCount(1));
    if (one_chunk_price.is_error()) {
        return one_chunk_price.propagate<ByteCount>();
    }

    // Not even a one-chunk transaction is affordable
    if (amount < one_chunk_price.value()) {
        return Ok(ByteCount(0));
    }

    auto per_chunk_price = one_chunk_price.value().minus(base_price.value());
    if (per_chunk_price.is_error()) {
        return Err<ByteCount>(ErrorKind::MalformedResponse,
                              "Oracle priced one chunk below an empty transaction: " + per_chunk_price.error().message);
    }
    if (per_chunk_price.value().is_zero()) {
        return Err<ByteCount>(ErrorKind::InvalidArgument,
                              "Per-chunk price is zero, byte count for a price cannot be estimated");
    }

    // amount >= price(1) >= price(0), so this cannot go negative
    auto spendable = amount.minus(base_price.value());
    if (spendable.is_error()) {
        return spendable.propagate<ByteCount>();
    }
    auto chunks = spendable.value().divided_by(per_chunk_price.value(), RoundingMode::Down);
    if (chunks.is_error()) {
        return chunks.propagate<ByteCount>();
    }

    const auto chunk_total = chunks.value().to_uint64();
    if (!chunk_total || *chunk_total > std::numeric_limits<std::uint64_t>::max() / kChunkByteSize) {
        return Err<ByteCount>(ErrorKind::InvalidArgument,
                              "Estimated byte count for " + amount.to_string() + " Winston exceeds 64 bits");
    }

    spdlog::debug("Estimated {} chunk(s) for {} Winston", *chunk_total, amount.to_string());
    return Ok(ByteCount(*chunk_total * kChunkByteSize));
}

Result<ByteCount> ArDataPriceEstimator::get_byte_count_for_ar(const std::string& ar_amount) {
    auto winston = Winston::from_ar_string(ar_amount);
    if (winston.is_error()) {
        return winston.propagate<ByteCount>();
    }
    return get_byte_count_for_price(winston.value());
}

} // namespace lfs::pricing
