#pragma once

#include "lfs/core/result.hpp"

#include <cstdint>
#include <string>

namespace lfs {
namespace network {

/**
 * @brief Absolute http(s) URL of a gateway, e.g. "https://arweave.net/"
 *
 * Only what the client needs: scheme, host, port and a base path that
 * relative endpoint names ("tx", "chunk", "price/1024") are appended to.
 */
struct Url {
    std::string scheme;     // "http" or "https"
    std::string host;
    std::uint16_t port = 0;
    std::string base_path;  // Always starts and ends with '/'

    static Result<Url> parse(const std::string& text);

    bool is_tls() const { return scheme == "https"; }

    /// "host" or "host:port" when the port is not the scheme default
    std::string host_header() const;

    /// Origin-form target for an endpoint below the base path
    std::string target_for(const std::string& relative) const;

    std::string to_string() const;
};

} // namespace network
} // namespace lfs
