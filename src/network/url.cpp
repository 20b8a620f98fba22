#include "lfs/network/url.hpp"

#include <algorithm>
#include <cctype>

namespace lfs {
namespace network {

Result<Url> Url::parse(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>(ErrorKind::InvalidArgument, "URL has no scheme: '" + text + "'");
    }

    Url url;
    url.scheme = text.substr(0, scheme_end);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>(ErrorKind::InvalidArgument, "Unsupported URL scheme: '" + url.scheme + "'");
    }

    const auto authority_begin = scheme_end + 3;
    const auto path_begin = text.find('/', authority_begin);
    const std::string authority = text.substr(authority_begin, path_begin - authority_begin);
    if (authority.empty()) {
        return Err<Url>(ErrorKind::InvalidArgument, "URL has no host: '" + text + "'");
    }

    const auto colon = authority.rfind(':');
    url.host = authority.substr(0, colon);
    url.port = url.is_tls() ? 443 : 80;
    if (colon != std::string::npos) {
        const std::string port = authority.substr(colon + 1);
        if (port.empty() || port.size() > 5 ||
            !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return Err<Url>(ErrorKind::InvalidArgument, "Invalid port in URL: '" + text + "'");
        }
        const unsigned long value = std::stoul(port);
        if (value == 0 || value > 65535) {
            return Err<Url>(ErrorKind::InvalidArgument, "Port out of range in URL: '" + text + "'");
        }
        url.port = static_cast<std::uint16_t>(value);
    }
    if (url.host.empty()) {
        return Err<Url>(ErrorKind::InvalidArgument, "URL has no host: '" + text + "'");
    }

    url.base_path = path_begin == std::string::npos ? "/" : text.substr(path_begin);
    if (url.base_path.back() != '/') {
        url.base_path += '/';
    }
    return Ok(url);
}

std::string Url::host_header() const {
    const std::uint16_t default_port = is_tls() ? 443 : 80;
    return port == default_port ? host : host + ":" + std::to_string(port);
}

std::string Url::target_for(const std::string& relative) const {
    std::string trimmed = relative;
    while (!trimmed.empty() && trimmed.front() == '/') {
        trimmed.erase(trimmed.begin());
    }
    return base_path + trimmed;
}

std::string Url::to_string() const {
    return scheme + "://" + host_header() + base_path;
}

} // namespace network
} // namespace lfs
