// FEEDROUTE - Decimal Normalization Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include <feedroute/feeds/decimals.h>
#include <feedroute/feeds/errors.h>

namespace feedroute {
namespace feeds {

namespace {

/// Largest power of ten that fits in 64 bits
constexpr unsigned int MAX_SMALL_EXPONENT = 19;
constexpr uint64_t TEN_POW_19 = 10000000000000000000ULL;

uint64_t SmallPowerOfTen(unsigned int exponent) {
    uint64_t result = 1;
    for (unsigned int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

} // namespace

Uint256 PowerOfTen(unsigned int exponent) {
    Uint256 result(1);
    unsigned int remaining = exponent;
    while (remaining > 0) {
        unsigned int step = remaining > MAX_SMALL_EXPONENT ? MAX_SMALL_EXPONENT : remaining;
        bool overflow = false;
        result = Uint256::MulSmall(result, SmallPowerOfTen(step), overflow);
        if (overflow) {
            throw RegistryError(RegistryErrorCode::ArithmeticOverflow,
                                "10^" + std::to_string(exponent) + " exceeds 256 bits");
        }
        remaining -= step;
    }
    return result;
}

Uint256 ToWei(const Uint256& value, int8_t decimals) {
    int shift = WEI_DECIMALS - static_cast<int>(decimals);

    if (shift >= 0) {
        // Only a result that does not fit overflows; 10^shift itself may not
        if (value.IsZero()) {
            return value;
        }
        Uint256 high;
        Uint256 result = Uint256::Mul(value, PowerOfTen(static_cast<unsigned int>(shift)), high);
        if (!high.IsZero()) {
            throw RegistryError(RegistryErrorCode::ArithmeticOverflow,
                                value.ToString() + " * 10^" + std::to_string(shift));
        }
        return result;
    }

    // floor(floor(a / b) / c) == floor(a / (b * c)), so divide in 64-bit steps
    Uint256 result = value;
    unsigned int remaining = static_cast<unsigned int>(-shift);
    while (remaining > 0 && !result.IsZero()) {
        unsigned int step = remaining > MAX_SMALL_EXPONENT ? MAX_SMALL_EXPONENT : remaining;
        uint64_t rem = 0;
        result = Uint256::DivSmall(result, step == MAX_SMALL_EXPONENT ? TEN_POW_19
                                                                      : SmallPowerOfTen(step),
                                   rem);
        remaining -= step;
    }
    return result;
}

std::vector<Uint256> ToWei(const std::vector<Uint256>& values,
                           const std::vector<int8_t>& decimals) {
    if (values.size() != decimals.size()) {
        throw RegistryError(RegistryErrorCode::ArrayLengthMismatch,
                            std::to_string(values.size()) + " values, " +
                            std::to_string(decimals.size()) + " decimals");
    }

    std::vector<Uint256> result;
    result.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        result.push_back(ToWei(values[i], decimals[i]));
    }
    return result;
}

} // namespace feeds
} // namespace feedroute
