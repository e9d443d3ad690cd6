// FEEDROUTE - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#ifndef FEEDROUTE_CORE_HEX_H
#define FEEDROUTE_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <stdexcept>

namespace feedroute {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

/// Convert hex string to bytes. A leading "0x" is accepted.
/// Throws std::invalid_argument on odd length or non-hex characters.
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex (optional 0x prefix, even length)
bool IsValidHex(const std::string& str);

/// Strip a leading "0x" / "0X"
std::string StripHexPrefix(const std::string& hex);

} // namespace feedroute

#endif // FEEDROUTE_CORE_HEX_H
