#include "lfs/network/http_client.hpp"
#include "lfs/network/http_response_parser.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <spdlog/spdlog.h>

#include <array>

namespace lfs {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

/**
 * @brief Write the request and read one response from a connected stream
 *
 * Works for both tcp::socket and ssl::stream<tcp::socket>. A clean close
 * (EOF, or an SSL stream truncated by a server that skips close_notify)
 * completes a response whose body has no Content-Length.
 */
template<typename Stream>
Result<HttpResponse> exchange(Stream& stream, const HttpRequest& request) {
    const std::vector<uint8_t> wire = request.serialize();
    asio::write(stream, asio::buffer(wire));

    HttpResponseParser parser;
    std::array<char, 8192> buffer;

    while (true) {
        boost::system::error_code ec;
        const size_t bytes_read = stream.read_some(asio::buffer(buffer), ec);

        if (bytes_read > 0) {
            auto parse_result = parser.parse(buffer.data(), bytes_read);
            if (parse_result.is_error()) {
                return Err<HttpResponse>(parse_result.error());
            }
            if (parse_result.value()) {
                return Ok(parser.get_response());
            }
        }

        if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
            if (auto finished = parser.finish(); finished.is_error()) {
                return Err<HttpResponse>(finished.error());
            }
            return Ok(parser.get_response());
        }
        if (ec) {
            return Err<HttpResponse>(ErrorKind::Network, "Read error: " + ec.message());
        }
    }
}

} // namespace

HttpClient::HttpClient(HttpClientOptions options)
    : options_(std::move(options)) {
}

Result<HttpResponse> HttpClient::send(const Url& url, HttpRequest request) {
    request.version = HttpVersion::HTTP_1_0;
    request.set_header("Host", url.host_header());
    request.set_header("Connection", "close");
    if (request.get_header("User-Agent").empty()) {
        request.set_header("User-Agent", options_.user_agent);
    }

    spdlog::debug("{} {}://{}{}", HttpMethodUtils::to_string(request.method),
                  url.scheme, url.host_header(), request.target);

    try {
        asio::io_context io_context;
        tcp::resolver resolver(io_context);
        const auto endpoints = resolver.resolve(url.host, std::to_string(url.port));

        if (!url.is_tls()) {
            tcp::socket socket(io_context);
            asio::connect(socket, endpoints);
            return exchange(socket, request);
        }

        asio::ssl::context tls_context(asio::ssl::context::tls_client);
        tls_context.set_default_verify_paths();

        asio::ssl::stream<tcp::socket> stream(io_context, tls_context);
        if (options_.verify_tls) {
            stream.set_verify_mode(asio::ssl::verify_peer);
            stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
        } else {
            stream.set_verify_mode(asio::ssl::verify_none);
        }
        // SNI: gateways sit behind CDNs that route on the server name
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            return Err<HttpResponse>(ErrorKind::Network, "Failed to set TLS server name for " + url.host);
        }

        asio::connect(stream.next_layer(), endpoints);
        stream.handshake(asio::ssl::stream_base::client);
        return exchange(stream, request);
    } catch (const boost::system::system_error& e) {
        spdlog::debug("Request to {} failed: {}", url.host, e.what());
        return Err<HttpResponse>(ErrorKind::Network, url.host + ": " + e.code().message());
    }
}

} // namespace network
} // namespace lfs
