#include "lfs/core/types.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace lfs {
namespace {

bool all_digits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace

std::optional<ByteCount> ByteCount::checked_plus(ByteCount other) const noexcept {
    if (other.bytes_ > std::numeric_limits<std::uint64_t>::max() - bytes_) {
        return std::nullopt;
    }
    return ByteCount(bytes_ + other.bytes_);
}

std::ostream& operator<<(std::ostream& os, ByteCount bytes) {
    return os << bytes.value() << " bytes";
}

std::uint64_t chunk_count(ByteCount bytes) noexcept {
    const auto value = bytes.value();
    return value / kChunkByteSize + (value % kChunkByteSize != 0 ? 1 : 0);
}

const Winston::Integer& Winston::per_ar() {
    static const Integer value = boost::multiprecision::pow(Integer(10), kArDecimals);
    return value;
}

Result<Winston> Winston::from_string(const std::string& digits) {
    if (!all_digits(digits)) {
        return Err<Winston>(ErrorKind::InvalidArgument, "Not a Winston amount: '" + digits + "'");
    }
    return Ok(Winston(Integer(digits)));
}

Result<Winston> Winston::from_ar_string(const std::string& ar) {
    const auto dot = ar.find('.');
    const std::string whole = ar.substr(0, dot);
    std::string fraction = dot == std::string::npos ? std::string() : ar.substr(dot + 1);

    if (!all_digits(whole) || (dot != std::string::npos && !all_digits(fraction))) {
        return Err<Winston>(ErrorKind::InvalidArgument, "Not an AR amount: '" + ar + "'");
    }
    if (fraction.size() > kArDecimals) {
        return Err<Winston>(ErrorKind::InvalidArgument,
                            "AR amount has more than 12 decimal places: '" + ar + "'");
    }

    fraction.append(kArDecimals - fraction.size(), '0');
    return Ok(Winston(Integer(whole) * per_ar() + Integer(fraction)));
}

Winston Winston::plus(const Winston& other) const {
    return Winston(amount_ + other.amount_);
}

Result<Winston> Winston::minus(const Winston& other) const {
    if (other.amount_ > amount_) {
        return Err<Winston>(ErrorKind::InvalidArgument,
                            "Winston subtraction would go negative: " + to_string() + " - " + other.to_string());
    }
    return Ok(Winston(amount_ - other.amount_));
}

Winston Winston::times(std::uint64_t factor) const {
    return Winston(amount_ * factor);
}

Result<Winston> Winston::divided_by(const Winston& divisor, RoundingMode mode) const {
    if (divisor.is_zero()) {
        return Err<Winston>(ErrorKind::InvalidArgument, "Division of Winston by zero");
    }
    Integer quotient = amount_ / divisor.amount_;
    if (mode == RoundingMode::Up && quotient * divisor.amount_ != amount_) {
        ++quotient;
    }
    return Ok(Winston(std::move(quotient)));
}

std::optional<std::uint64_t> Winston::to_uint64() const {
    if (amount_ > std::numeric_limits<std::uint64_t>::max()) {
        return std::nullopt;
    }
    return amount_.convert_to<std::uint64_t>();
}

std::string Winston::to_string() const {
    return amount_.str();
}

std::string Winston::to_ar_string() const {
    const Integer whole = amount_ / per_ar();
    std::string fraction = Integer(amount_ % per_ar()).str();
    fraction.insert(0, kArDecimals - fraction.size(), '0');

    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }
    return fraction.empty() ? whole.str() : whole.str() + "." + fraction;
}

std::ostream& operator<<(std::ostream& os, const Winston& winston) {
    return os << winston.to_string() << " Winston";
}

} // namespace lfs
