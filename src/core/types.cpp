// FEEDROUTE - Core Types Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include "feedroute/core/types.h"
#include "feedroute/core/hex.h"

namespace feedroute {

// ============================================================================
// FixedBytes Implementation
// ============================================================================

template<size_t BYTES>
std::string FixedBytes<BYTES>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BYTES>
FixedBytes<BYTES> FixedBytes<BYTES>::FromHex(const std::string& hex) {
    std::vector<Byte> bytes = HexToBytes(hex);
    if (bytes.size() != SIZE) {
        throw std::invalid_argument("Invalid hex string length: expected " +
                                    std::to_string(SIZE) + " bytes, got " +
                                    std::to_string(bytes.size()));
    }
    return FixedBytes(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class FixedBytes<32>;
template class FixedBytes<21>;
template class FixedBytes<20>;

} // namespace feedroute
