#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace lfs {
namespace network {

/**
 * @brief HTTP request methods used against a gateway
 *
 * The engine only ever reads prices (GET) and submits transactions and
 * chunks (POST).
 */
enum class HttpMethod {
    GET,
    POST,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,  // What we send: no chunked transfer coding, server closes when done
    HTTP_1_1,
    UNKNOWN
};

namespace detail {

inline std::string find_header(const std::unordered_map<std::string, std::string>& headers,
                               const std::string& name) {
    // HTTP headers are case-insensitive per RFC 7230
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

} // namespace detail

/**
 * @brief Outgoing HTTP request
 *
 * `target` is the origin-form request target ("/price/1024"). The Host
 * header is filled in by the client from the URL it connects to.
 *
 * The body is a byte vector because chunk uploads are binary-safe JSON and
 * may be large.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target = "/";
    HttpVersion version = HttpVersion::HTTP_1_0;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    void set_body(const std::string& content, const std::string& content_type) {
        body.assign(content.begin(), content.end());
        headers["Content-Type"] = content_type;
    }

    /**
     * @brief Serialize the request to the HTTP wire format
     *
     * Content-Length is always emitted for POST so that the gateway never
     * has to guess where the body ends.
     */
    std::vector<uint8_t> serialize() const;
};

/**
 * @brief Parsed HTTP response
 *
 * Example:
 * HTTP/1.1 400 Bad Request
 * Content-Type: application/json
 * Content-Length: 25
 *
 * {"error":"invalid_proof"}
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 0;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            default: return "UNKNOWN";
        }
    }
};

inline std::string version_to_string(HttpVersion version) {
    switch (version) {
        case HttpVersion::HTTP_1_0: return "HTTP/1.0";
        case HttpVersion::HTTP_1_1: return "HTTP/1.1";
        default: return "HTTP/1.0";
    }
}

inline std::vector<uint8_t> HttpRequest::serialize() const {
    std::ostringstream oss;

    // Request line
    oss << HttpMethodUtils::to_string(method) << " " << target << " "
        << version_to_string(version) << "\r\n";

    for (const auto& [name, value] : headers) {
        oss << name << ": " << value << "\r\n";
    }
    if (get_header("Content-Length").empty() && (method == HttpMethod::POST || !body.empty())) {
        oss << "Content-Length: " << body.size() << "\r\n";
    }

    // Empty line separates headers from body
    oss << "\r\n";

    std::string header_str = oss.str();
    std::vector<uint8_t> result(header_str.begin(), header_str.end());
    result.insert(result.end(), body.begin(), body.end());
    return result;
}

} // namespace network
} // namespace lfs
