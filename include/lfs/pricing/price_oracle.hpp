#pragma once

#include "lfs/core/result.hpp"
#include "lfs/core/types.hpp"

namespace lfs::pricing {

/**
 * @brief Source of the network's current storage price
 *
 * Implementations may block on the network and may fail; failures are
 * returned, never cached by callers.
 */
class PriceOracle {
public:
    virtual ~PriceOracle() = default;

    virtual Result<Winston> price_for_byte_count(ByteCount bytes) = 0;
};

} // namespace lfs::pricing
