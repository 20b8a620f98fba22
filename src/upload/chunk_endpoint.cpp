#include "lfs/upload/chunk_endpoint.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lfs::upload {
namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// Gateways answer {"error": "invalid_proof"} or a bare text reason
std::string extract_error_code(const network::HttpResponse& response) {
    const std::string body = trim(response.body_as_string());

    const auto document = nlohmann::json::parse(body, nullptr, false);
    if (!document.is_discarded() && document.is_object()) {
        const auto it = document.find("error");
        if (it != document.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }

    if (!body.empty()) {
        return body;
    }
    if (!response.reason_phrase.empty()) {
        return response.reason_phrase;
    }
    return "HTTP " + std::to_string(response.status_code);
}

} // namespace

GatewayChunkEndpoint::GatewayChunkEndpoint(network::HttpTransport& transport, network::Url gateway)
    : transport_(transport),
      gateway_(std::move(gateway)) {
}

EndpointReply GatewayChunkEndpoint::post_transaction(const std::string& body) {
    return post("tx", body);
}

EndpointReply GatewayChunkEndpoint::post_chunk(const std::string& body) {
    return post("chunk", body);
}

EndpointReply GatewayChunkEndpoint::post(const std::string& endpoint, const std::string& body) {
    network::HttpRequest request;
    request.method = network::HttpMethod::POST;
    request.target = gateway_.target_for(endpoint);
    request.set_body(body, "application/json");

    auto response = transport_.send(gateway_, std::move(request));
    if (response.is_error()) {
        return EndpointReply{0, response.error().message};
    }

    EndpointReply reply;
    reply.status = response.value().status_code;
    if (!reply.ok()) {
        reply.error_code = extract_error_code(response.value());
        spdlog::debug("POST /{} answered {}: {}", endpoint, reply.status, reply.error_code);
    }
    return reply;
}

} // namespace lfs::upload
