#include "lfs/core/encoding.hpp"

namespace lfs {
namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '-') return 62;
    if (c == '_') return 63;
    return -1;
}

template<typename Bytes>
std::string encode(const Bytes& data) {
    std::string out;
    out.reserve((data.size() * 4 + 2) / 3);

    std::size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        const std::uint32_t triple = (static_cast<std::uint8_t>(data[i]) << 16) |
                                     (static_cast<std::uint8_t>(data[i + 1]) << 8) |
                                     static_cast<std::uint8_t>(data[i + 2]);
        out += kAlphabet[(triple >> 18) & 0x3F];
        out += kAlphabet[(triple >> 12) & 0x3F];
        out += kAlphabet[(triple >> 6) & 0x3F];
        out += kAlphabet[triple & 0x3F];
    }

    const std::size_t rest = data.size() - i;
    if (rest == 1) {
        const std::uint32_t single = static_cast<std::uint8_t>(data[i]) << 16;
        out += kAlphabet[(single >> 18) & 0x3F];
        out += kAlphabet[(single >> 12) & 0x3F];
    } else if (rest == 2) {
        const std::uint32_t pair = (static_cast<std::uint8_t>(data[i]) << 16) |
                                   (static_cast<std::uint8_t>(data[i + 1]) << 8);
        out += kAlphabet[(pair >> 18) & 0x3F];
        out += kAlphabet[(pair >> 12) & 0x3F];
        out += kAlphabet[(pair >> 6) & 0x3F];
    }
    return out;
}

} // namespace

std::string base64url_encode(const std::vector<std::uint8_t>& data) {
    return encode(data);
}

std::string base64url_encode(const std::string& text) {
    return encode(text);
}

Result<std::vector<std::uint8_t>> base64url_decode(const std::string& encoded) {
    std::string input = encoded;
    while (!input.empty() && input.back() == '=') {
        input.pop_back();
    }
    if (input.size() % 4 == 1) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::InvalidArgument, "Truncated base64url input");
    }

    std::vector<std::uint8_t> out;
    out.reserve(input.size() * 3 / 4);

    std::uint32_t buffer = 0;
    int bits = 0;
    for (char c : input) {
        const int value = decode_char(c);
        if (value < 0) {
            return Err<std::vector<std::uint8_t>>(ErrorKind::InvalidArgument,
                                                  std::string("Invalid base64url character '") + c + "'");
        }
        buffer = (buffer << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return Ok(std::move(out));
}

} // namespace lfs
