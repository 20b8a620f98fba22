#pragma once

#include "lfs/core/result.hpp"
#include "lfs/core/types.hpp"
#include "lfs/pricing/chunk_price_cache.hpp"
#include "lfs/pricing/price_oracle.hpp"

#include <string>

namespace lfs::pricing {

/**
 * @brief Data price estimation with chunk-quantized caching
 *
 * The network prices storage in 256 KiB chunks, so every byte count that
 * rounds up to the same chunk count shares one cache entry and at most one
 * oracle query.
 *
 * Both the oracle and the cache are borrowed and must outlive the
 * estimator. Handing the same cache to several estimators shares prices
 * between them.
 */
class ArDataPriceEstimator {
public:
    ArDataPriceEstimator(PriceOracle& oracle, ChunkPriceCache& cache);

    /**
     * @brief Base price in Winston for a transaction of `bytes`
     *
     * On a miss the oracle is asked about the original byte count (not the
     * rounded one) and the answer is stored under the chunk count. Oracle
     * failures are returned as-is and leave the cache untouched.
     */
    Result<Winston> get_base_price(ByteCount bytes);

    /**
     * @brief Rough number of bytes that `amount` Winston can pay for
     *
     * ESTIMATE ONLY - do not use to calculate real values. Samples two
     * prices, price(0 bytes) as the fixed cost and price(1 byte) as the
     * one-chunk cost, and extrapolates linearly:
     *
     *   chunks = floor((amount - price(0)) / (price(1) - price(0)))
     *   bytes  = chunks * 256 KiB
     *
     * Real network pricing may grow faster than linearly with size.
     * Returns 0 when amount does not cover a one-chunk transaction.
     */
    Result<ByteCount> get_byte_count_for_price(const Winston& amount);

    /// Same estimate for an amount given in AR ("0.5")
    Result<ByteCount> get_byte_count_for_ar(const std::string& ar_amount);

private:
    PriceOracle& oracle_;
    ChunkPriceCache& cache_;
};

} // namespace lfs::pricing
