#pragma once

#include "http_types.hpp"
#include "url.hpp"
#include "lfs/core/result.hpp"

#include <string>

namespace lfs {
namespace network {

/**
 * @brief Abstract request/response transport
 *
 * The gateway oracle and the chunk endpoint talk to the network through
 * this seam so that tests can substitute a scripted transport.
 *
 * A transport failure (DNS, connect, TLS, truncated reply) is an
 * ErrorKind::Network error. Any complete HTTP reply, including 4xx/5xx, is
 * returned as a successful Result; interpreting the status is up to the
 * caller.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse> send(const Url& url, HttpRequest request) = 0;
};

struct HttpClientOptions {
    bool verify_tls = true;
    std::string user_agent = "ledgerfs/0.1";
};

/**
 * @brief Blocking HTTP/1.0 client built on Boost.Asio
 *
 * Every call owns its own io_context and socket, so one client may be used
 * from several uploader worker threads at once. Requests go out as
 * HTTP/1.0 with "Connection: close", which keeps responses free of chunked
 * transfer coding; the body is read until Content-Length or EOF.
 *
 * https URLs are served through asio::ssl (OpenSSL) with SNI and host name
 * verification.
 */
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(HttpClientOptions options = {});

    Result<HttpResponse> send(const Url& url, HttpRequest request) override;

private:
    HttpClientOptions options_;
};

} // namespace network
} // namespace lfs
