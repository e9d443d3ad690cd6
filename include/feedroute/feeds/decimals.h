// FEEDROUTE - Decimal Normalization
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// Feed readings carry their own decimal exponent. Consumers that want a
// uniform scale can convert to 18 decimal places ("wei").

#ifndef FEEDROUTE_FEEDS_DECIMALS_H
#define FEEDROUTE_FEEDS_DECIMALS_H

#include <feedroute/core/uint256.h>

#include <cstdint>
#include <vector>

namespace feedroute {
namespace feeds {

/// Target scale of wei-normalized values
constexpr int WEI_DECIMALS = 18;

/// 10^exponent; throws RegistryError(ArithmeticOverflow) above 10^77
Uint256 PowerOfTen(unsigned int exponent);

/**
 * Rescale value from `decimals` places to 18 places.
 *
 * Scaling up multiplies and fails with ArithmeticOverflow if the result
 * does not fit 256 bits. Scaling down uses floor division; the discarded
 * digits are lost.
 */
Uint256 ToWei(const Uint256& value, int8_t decimals);

/**
 * Element-wise ToWei.
 * @throws RegistryError ArrayLengthMismatch if the sequences differ in length
 */
std::vector<Uint256> ToWei(const std::vector<Uint256>& values,
                           const std::vector<int8_t>& decimals);

} // namespace feeds
} // namespace feedroute

#endif // FEEDROUTE_FEEDS_DECIMALS_H
