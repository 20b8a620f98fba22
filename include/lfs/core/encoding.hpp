#pragma once

#include "lfs/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lfs {

/// RFC 4648 §5 base64url without padding, the ledger's binary field encoding
std::string base64url_encode(const std::vector<std::uint8_t>& data);

std::string base64url_encode(const std::string& text);

/// Accepts input with or without '=' padding
Result<std::vector<std::uint8_t>> base64url_decode(const std::string& encoded);

} // namespace lfs
