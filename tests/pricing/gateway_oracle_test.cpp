#include "lfs/pricing/gateway_oracle.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using lfs::ByteCount;
using lfs::ErrorKind;
using lfs::Result;
using lfs::Winston;
using lfs::network::HttpRequest;
using lfs::network::HttpResponse;
using lfs::network::HttpTransport;
using lfs::network::Url;
using lfs::pricing::GatewayOracle;

namespace {

class ScriptedTransport : public HttpTransport {
public:
    Result<HttpResponse> send(const Url&, HttpRequest request) override {
        targets.push_back(request.target);
        if (fail_transport) {
            return lfs::Err<HttpResponse>(ErrorKind::Network, "connection refused");
        }
        HttpResponse response;
        response.status_code = status;
        response.reason_phrase = status == 200 ? "OK" : "Service Unavailable";
        response.body.assign(body.begin(), body.end());
        return lfs::Ok(response);
    }

    int status = 200;
    std::string body;
    bool fail_transport = false;
    std::vector<std::string> targets;
};

Url gateway() {
    return Url::parse("https://arweave.net/").value();
}

} // namespace

TEST(GatewayOracleTest, QueriesPriceEndpointAndParsesWinston) {
    ScriptedTransport transport;
    transport.body = "1331429024\n";
    GatewayOracle oracle(transport, gateway());

    auto price = oracle.price_for_byte_count(ByteCount(262144));
    ASSERT_TRUE(price.is_ok());
    EXPECT_EQ(price.value(), Winston(1331429024));
    EXPECT_EQ(transport.targets, (std::vector<std::string>{"/price/262144"}));
}

TEST(GatewayOracleTest, NonSuccessStatusIsNetworkError) {
    ScriptedTransport transport;
    transport.status = 503;
    GatewayOracle oracle(transport, gateway());

    auto price = oracle.price_for_byte_count(ByteCount(1));
    ASSERT_TRUE(price.is_error());
    EXPECT_EQ(price.error().kind, ErrorKind::Network);
}

TEST(GatewayOracleTest, TransportFailureIsPropagated) {
    ScriptedTransport transport;
    transport.fail_transport = true;
    GatewayOracle oracle(transport, gateway());

    auto price = oracle.price_for_byte_count(ByteCount(1));
    ASSERT_TRUE(price.is_error());
    EXPECT_EQ(price.error().kind, ErrorKind::Network);
}

TEST(GatewayOracleTest, NonNumericBodyIsMalformed) {
    ScriptedTransport transport;
    transport.body = "<html>rate limited</html>";
    GatewayOracle oracle(transport, gateway());

    auto price = oracle.price_for_byte_count(ByteCount(1));
    ASSERT_TRUE(price.is_error());
    EXPECT_EQ(price.error().kind, ErrorKind::MalformedResponse);
}
