#pragma once

#include "lfs/network/http_client.hpp"
#include "lfs/network/url.hpp"
#include "lfs/pricing/price_oracle.hpp"

namespace lfs::pricing {

/**
 * @brief Asks a gateway for the base price of a transaction: GET /price/{bytes}
 *
 * The gateway answers with a bare decimal Winston amount.
 */
class GatewayOracle : public PriceOracle {
public:
    GatewayOracle(network::HttpTransport& transport, network::Url gateway);

    Result<Winston> price_for_byte_count(ByteCount bytes) override;

private:
    network::HttpTransport& transport_;
    network::Url gateway_;
};

} // namespace lfs::pricing
