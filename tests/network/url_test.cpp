#include "lfs/network/url.hpp"
#include "lfs/network/http_types.hpp"

#include <gtest/gtest.h>

#include <string>

using lfs::network::HttpMethod;
using lfs::network::HttpRequest;
using lfs::network::Url;

TEST(UrlTest, ParsesGatewayWithDefaultPort) {
    auto url = Url::parse("https://arweave.net/");
    ASSERT_TRUE(url.is_ok());

    EXPECT_EQ(url.value().scheme, "https");
    EXPECT_EQ(url.value().host, "arweave.net");
    EXPECT_EQ(url.value().port, 443);
    EXPECT_TRUE(url.value().is_tls());
    EXPECT_EQ(url.value().host_header(), "arweave.net");
    EXPECT_EQ(url.value().target_for("price/1024"), "/price/1024");
}

TEST(UrlTest, KeepsExplicitPortAndBasePath) {
    auto url = Url::parse("http://localhost:1984/gateway");
    ASSERT_TRUE(url.is_ok());

    EXPECT_EQ(url.value().port, 1984);
    EXPECT_FALSE(url.value().is_tls());
    EXPECT_EQ(url.value().base_path, "/gateway/");
    EXPECT_EQ(url.value().host_header(), "localhost:1984");
    EXPECT_EQ(url.value().target_for("/chunk"), "/gateway/chunk");
    EXPECT_EQ(url.value().to_string(), "http://localhost:1984/gateway/");
}

TEST(UrlTest, HostWithoutPathGetsRootPath) {
    auto url = Url::parse("HTTP://example.org");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().scheme, "http");
    EXPECT_EQ(url.value().port, 80);
    EXPECT_EQ(url.value().target_for("tx"), "/tx");
}

TEST(UrlTest, RejectsUnusableUrls) {
    for (const char* bad : {"arweave.net", "ftp://arweave.net/", "https:///tx", "http://host:0/",
                            "http://host:70000/", "http://host:abc/", "http://:80/"}) {
        auto url = Url::parse(bad);
        ASSERT_TRUE(url.is_error()) << bad;
        EXPECT_EQ(url.error().kind, lfs::ErrorKind::InvalidArgument);
    }
}

TEST(HttpRequestTest, SerializesPostWithContentLength) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.target = "/chunk";
    request.set_header("Host", "arweave.net");
    request.set_body("{\"a\":1}", "application/json");

    const auto wire = request.serialize();
    const std::string text(wire.begin(), wire.end());

    EXPECT_EQ(text.rfind("POST /chunk HTTP/1.0\r\n", 0), 0u);
    EXPECT_NE(text.find("Content-Length: 7\r\n"), std::string::npos);
    EXPECT_NE(text.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_EQ(text.substr(text.size() - 11), "\r\n\r\n{\"a\":1}");
}
