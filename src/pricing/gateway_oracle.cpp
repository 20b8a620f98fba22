#include "lfs/pricing/gateway_oracle.hpp"

#include <spdlog/spdlog.h>

namespace lfs::pricing {
namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

GatewayOracle::GatewayOracle(network::HttpTransport& transport, network::Url gateway)
    : transport_(transport),
      gateway_(std::move(gateway)) {
}

Result<Winston> GatewayOracle::price_for_byte_count(ByteCount bytes) {
    network::HttpRequest request;
    request.method = network::HttpMethod::GET;
    request.target = gateway_.target_for("price/" + std::to_string(bytes.value()));

    auto response = transport_.send(gateway_, std::move(request));
    if (response.is_error()) {
        return Err<Winston>(response.error());
    }

    const auto& reply = response.value();
    if (!reply.is_success()) {
        return Err<Winston>(ErrorKind::Network,
                            "Gateway price request failed with HTTP " + std::to_string(reply.status_code) +
                                " " + reply.reason_phrase);
    }

    const std::string body = trim(reply.body_as_string());
    auto price = Winston::from_string(body);
    if (price.is_error()) {
        return Err<Winston>(ErrorKind::MalformedResponse, "Gateway returned an invalid price: '" + body + "'");
    }

    spdlog::debug("Gateway price for {} bytes: {} Winston", bytes.value(), price.value().to_string());
    return price;
}

} // namespace lfs::pricing
