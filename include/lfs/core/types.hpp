#pragma once

/**
 * @file types.hpp
 * @brief Exact byte and currency quantities used by packing and pricing
 *
 * Ledger storage is paid per byte, so every quantity here is an exact
 * integer. There is deliberately no conversion to or from floating point.
 *
 * - ByteCount: unsigned 64-bit byte count with overflow-checked addition
 * - Winston:   ledger-native currency unit, arbitrary precision, never negative
 * - AR:        display denomination, 1 AR = 10^12 Winston, handled as exact
 *              decimal strings
 */

#include "lfs/core/result.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace lfs {

class ByteCount {
public:
    constexpr ByteCount() = default;
    constexpr explicit ByteCount(std::uint64_t bytes) : bytes_(bytes) {}

    constexpr std::uint64_t value() const noexcept { return bytes_; }

    /// Empty when the sum does not fit in 64 bits
    std::optional<ByteCount> checked_plus(ByteCount other) const noexcept;

    constexpr bool operator==(ByteCount other) const noexcept { return bytes_ == other.bytes_; }
    constexpr bool operator!=(ByteCount other) const noexcept { return bytes_ != other.bytes_; }
    constexpr bool operator<(ByteCount other) const noexcept { return bytes_ < other.bytes_; }
    constexpr bool operator<=(ByteCount other) const noexcept { return bytes_ <= other.bytes_; }
    constexpr bool operator>(ByteCount other) const noexcept { return bytes_ > other.bytes_; }
    constexpr bool operator>=(ByteCount other) const noexcept { return bytes_ >= other.bytes_; }

private:
    std::uint64_t bytes_ = 0;
};

std::ostream& operator<<(std::ostream& os, ByteCount bytes);

/// Transactions are priced in 256 KiB chunks
inline constexpr std::uint64_t kChunkByteSize = 256 * 1024;

/// ceil(bytes / kChunkByteSize); used only as a pricing cache key
std::uint64_t chunk_count(ByteCount bytes) noexcept;

enum class RoundingMode {
    Down,
    Up
};

class Winston {
public:
    using Integer = boost::multiprecision::cpp_int;

    /// Number of Winston in one AR
    static const Integer& per_ar();
    static constexpr unsigned kArDecimals = 12;

    Winston() = default;
    explicit Winston(std::uint64_t amount) : amount_(amount) {}

    /// Parses a base-10 digit string ("0", "1250000")
    static Result<Winston> from_string(const std::string& digits);

    /// Parses an exact AR decimal ("1", "0.000002500000")
    static Result<Winston> from_ar_string(const std::string& ar);

    const Integer& amount() const noexcept { return amount_; }

    Winston plus(const Winston& other) const;
    Result<Winston> minus(const Winston& other) const;
    Winston times(std::uint64_t factor) const;
    Result<Winston> divided_by(const Winston& divisor, RoundingMode mode) const;

    /// Lossless narrowing for values that are known to be small
    std::optional<std::uint64_t> to_uint64() const;

    std::string to_string() const;

    /// Exact AR decimal with trailing fractional zeros trimmed ("1.5", "0")
    std::string to_ar_string() const;

    bool is_zero() const { return amount_.is_zero(); }

    bool operator==(const Winston& other) const { return amount_ == other.amount_; }
    bool operator!=(const Winston& other) const { return amount_ != other.amount_; }
    bool operator<(const Winston& other) const { return amount_ < other.amount_; }
    bool operator<=(const Winston& other) const { return amount_ <= other.amount_; }
    bool operator>(const Winston& other) const { return amount_ > other.amount_; }
    bool operator>=(const Winston& other) const { return amount_ >= other.amount_; }

private:
    explicit Winston(Integer amount) : amount_(std::move(amount)) {}

    Integer amount_{0};
};

std::ostream& operator<<(std::ostream& os, const Winston& winston);

} // namespace lfs
