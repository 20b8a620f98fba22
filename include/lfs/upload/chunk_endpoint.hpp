#pragma once

#include "lfs/network/http_client.hpp"

#include <string>

namespace lfs::upload {

/**
 * @brief What the gateway said about one POST
 *
 * status == 0 means the request never got an HTTP reply (transport
 * failure); error_code then carries the transport message. For non-2xx
 * replies error_code is the gateway's error identifier, e.g. "invalid_proof".
 */
struct EndpointReply {
    int status = 0;
    std::string error_code;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Where transaction headers and chunks are delivered
 *
 * Implementations must be safe to call from several uploader workers at once.
 */
class ChunkEndpoint {
public:
    virtual ~ChunkEndpoint() = default;

    virtual EndpointReply post_transaction(const std::string& body) = 0;
    virtual EndpointReply post_chunk(const std::string& body) = 0;
};

class GatewayChunkEndpoint : public ChunkEndpoint {
public:
    GatewayChunkEndpoint(network::HttpTransport& transport, network::Url gateway);

    EndpointReply post_transaction(const std::string& body) override;
    EndpointReply post_chunk(const std::string& body) override;

private:
    EndpointReply post(const std::string& endpoint, const std::string& body);

    network::HttpTransport& transport_;
    network::Url gateway_;
};

} // namespace lfs::upload
