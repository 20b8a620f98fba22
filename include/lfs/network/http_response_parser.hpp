#pragma once

#include "http_types.hpp"
#include "lfs/core/result.hpp"

#include <cctype>
#include <string>

namespace lfs {
namespace network {

/**
 * @brief State machine states for HTTP response parsing
 *
 * HTTP Response Format:
 * VERSION SP STATUS SP REASON CRLF   <- Status line
 * Header-Name: Header-Value CRLF     <- Headers (multiple)
 * CRLF                               <- Empty line
 * [Body]                             <- Content-Length bytes, or until EOF
 */
enum class ParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP response parser
 *
 * Bytes are fed as they arrive from the socket. When the server sends no
 * Content-Length the body runs until the connection closes; call finish()
 * once the peer has closed to complete such a response.
 *
 * Usage:
 * ```cpp
 * HttpResponseParser parser;
 * while (!parser.is_complete()) {
 *     auto n = socket.read_some(buffer, ec);
 *     if (ec == asio::error::eof) { parser.finish(); break; }
 *     auto result = parser.parse(buffer.data(), n);
 * }
 * HttpResponse response = parser.get_response();
 * ```
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    /**
     * @return true once the response is complete, false if more data is needed
     */
    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            const char c = data[i];
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::VERSION:      ok = parse_version(c); break;
                case ParseState::STATUS_CODE:  ok = parse_status_code(c); break;
                case ParseState::REASON:       ok = parse_reason(c); break;
                case ParseState::HEADER_NAME:  ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                case ParseState::BODY:         parse_body(c); break;
                case ParseState::COMPLETE:
                    // Trailing bytes after a complete response are ignored
                    return Ok(true);
                case ParseState::PARSE_ERROR:
                    return Err<bool>(ErrorKind::MalformedResponse, "Parser in error state");
            }

            if (!ok) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool>(ErrorKind::MalformedResponse,
                                 "Malformed HTTP response at line " + std::to_string(line_));
            }
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }
        return Ok(false);
    }

    /**
     * @brief Signal that the peer closed the connection
     *
     * Completes a read-until-close body; anything else still pending means
     * the response was truncated.
     */
    Result<void> finish() {
        if (state_ == ParseState::COMPLETE) {
            return Ok();
        }
        if (state_ == ParseState::BODY && !expected_length_known_) {
            state_ = ParseState::COMPLETE;
            return Ok();
        }
        state_ = ParseState::PARSE_ERROR;
        return Err<void>(ErrorKind::MalformedResponse, "Connection closed before the response was complete");
    }

    HttpResponse get_response() const {
        return response_;
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    void reset() {
        state_ = ParseState::VERSION;
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        expected_length_ = 0;
        expected_length_known_ = false;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    ParseState state_;
    HttpResponse response_;
    std::string buffer_;
    std::string current_header_name_;
    size_t expected_length_;
    bool expected_length_known_;
    size_t line_;
    bool last_char_was_cr_;

    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_ == "HTTP/1.1") {
                response_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                response_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::STATUS_CODE;
            return true;
        }
        if (buffer_.size() >= 8) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_status_code(char c) {
        if (c == ' ' || c == '\r') {
            if (buffer_.size() != 3) {
                return false;
            }
            response_.status_code = std::stoi(buffer_);
            buffer_.clear();
            last_char_was_cr_ = (c == '\r');
            state_ = ParseState::REASON;
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c)) || buffer_.size() >= 3) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            // Empty line - headers complete
            last_char_was_cr_ = false;
            return begin_body();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            response_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool begin_body() {
        const int status = response_.status_code;
        if ((status >= 100 && status < 200) || status == 204 || status == 304) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        const std::string content_length = response_.get_header("Content-Length");
        if (content_length.empty()) {
            // No length: body runs until the server closes the connection
            state_ = ParseState::BODY;
            return true;
        }

        if (content_length.size() > 18) {
            return false;
        }
        for (char digit : content_length) {
            if (!std::isdigit(static_cast<unsigned char>(digit))) {
                return false;
            }
        }
        expected_length_ = std::stoull(content_length);
        expected_length_known_ = true;
        if (expected_length_ == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        response_.body.reserve(expected_length_);
        state_ = ParseState::BODY;
        return true;
    }

    void parse_body(char c) {
        response_.body.push_back(static_cast<uint8_t>(c));
        if (expected_length_known_ && response_.body.size() >= expected_length_) {
            state_ = ParseState::COMPLETE;
        }
    }
};

} // namespace network
} // namespace lfs
