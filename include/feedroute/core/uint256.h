// FEEDROUTE - 256-bit Unsigned Integer
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// Feed values travel as 256-bit unsigned integers. Arithmetic helpers report
// overflow to the caller instead of wrapping silently.

#ifndef FEEDROUTE_CORE_UINT256_H
#define FEEDROUTE_CORE_UINT256_H

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>

#include "feedroute/core/types.h"

namespace feedroute {

/// 256-bit unsigned integer represented as 4 x 64-bit limbs (little-endian)
class Uint256 {
public:
    static constexpr size_t NUM_LIMBS = 4;

    /// Limbs in little-endian order (limb[0] is least significant)
    std::array<uint64_t, NUM_LIMBS> limbs;

    /// Default constructor - zero
    constexpr Uint256() : limbs{0, 0, 0, 0} {}

    /// Construct from limbs (little-endian)
    constexpr Uint256(uint64_t l0, uint64_t l1, uint64_t l2, uint64_t l3)
        : limbs{l0, l1, l2, l3} {}

    /// Construct from single value
    constexpr Uint256(uint64_t val) : limbs{val, 0, 0, 0} {}

    /// Parse hex string (optional 0x prefix, at most 64 digits)
    static Uint256 FromHex(const std::string& hex);

    /// Parse base-10 string; throws std::invalid_argument or std::overflow_error
    static Uint256 FromDecimal(const std::string& dec);

    /// Hex string, 64 digits, no prefix
    std::string ToHex() const;

    /// Base-10 string
    std::string ToString() const;

    /// Big-endian 32-byte encoding
    std::array<Byte, 32> ToBigEndian() const;

    /// Check if zero
    bool IsZero() const;

    /// True if the value fits in 64 bits
    bool FitsUint64() const { return limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0; }

    bool operator==(const Uint256& other) const;
    bool operator!=(const Uint256& other) const;
    bool operator<(const Uint256& other) const;
    bool operator<=(const Uint256& other) const;
    bool operator>(const Uint256& other) const;
    bool operator>=(const Uint256& other) const;

    static Uint256 Add(const Uint256& a, const Uint256& b, bool& carry);
    static Uint256 Sub(const Uint256& a, const Uint256& b, bool& borrow);
    static Uint256 Mul(const Uint256& a, const Uint256& b, Uint256& high);

    /// Multiply by a 64-bit factor; overflow is set if the product exceeds 256 bits
    static Uint256 MulSmall(const Uint256& a, uint64_t b, bool& overflow);

    /// Floor division by a non-zero 64-bit divisor
    static Uint256 DivSmall(const Uint256& a, uint64_t divisor, uint64_t& remainder);
};

std::ostream& operator<<(std::ostream& os, const Uint256& value);

} // namespace feedroute

#endif // FEEDROUTE_CORE_UINT256_H
