// FEEDROUTE - Core Types Header
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// This file defines fundamental types used throughout FEEDROUTE.

#ifndef FEEDROUTE_CORE_TYPES_H
#define FEEDROUTE_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>
#include <functional>

namespace feedroute {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Native value amount in wei (fees and forwarded payments)
using Amount = uint64_t;

/// Feed observation timestamp (Unix epoch seconds)
using Timestamp = uint64_t;

/// Position of a feed in the index-addressed configuration list
using FeedIndex = uint32_t;

// ============================================================================
// Fixed-width byte strings
// ============================================================================

/// Fixed-size byte string. Bytes are kept and displayed in natural order;
/// ordering is lexicographic, which equals big-endian numeric ordering.
template<size_t BYTES>
class FixedBytes {
public:
    static constexpr size_t SIZE = BYTES;

    /// Default constructor - all zeros
    FixedBytes() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit FixedBytes(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (shorter input is zero padded on the right)
    FixedBytes(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    /// Check if all bytes are zero
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set all bytes to zero
    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const FixedBytes& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const FixedBytes& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const FixedBytes& other) const noexcept {
        return std::memcmp(data_.data(), other.data_.data(), SIZE) < 0;
    }

    /// Lowercase hex, no prefix
    std::string ToHex() const;

    /// Parse hex (optional 0x prefix); throws std::invalid_argument
    static FixedBytes FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (32 bytes)
class Hash256 : public FixedBytes<32> {
public:
    using FixedBytes<32>::FixedBytes;
    Hash256() = default;
    Hash256(const FixedBytes<32>& b) : FixedBytes<32>(b) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(FixedBytes<32>::FromHex(hex));
    }
};

/// 160-bit account or contract address (20 bytes)
class Address : public FixedBytes<20> {
public:
    using FixedBytes<20>::FixedBytes;
    Address() = default;
    Address(const FixedBytes<20>& b) : FixedBytes<20>(b) {}

    static Address FromHex(const std::string& hex) {
        return Address(FixedBytes<20>::FromHex(hex));
    }
};

/// Feed identifier (21 bytes): category byte followed by a 20-byte name
class FeedId : public FixedBytes<21> {
public:
    using FixedBytes<21>::FixedBytes;
    FeedId() = default;
    FeedId(const FixedBytes<21>& b) : FixedBytes<21>(b) {}

    /// Category tag (first byte)
    Byte Category() const noexcept { return data_[0]; }

    static FeedId FromHex(const std::string& hex) {
        return FeedId(FixedBytes<21>::FromHex(hex));
    }
};

/// Hash functor for unordered containers keyed by fixed-width bytes
struct FixedBytesHasher {
    template<size_t N>
    size_t operator()(const FixedBytes<N>& b) const noexcept {
        // FNV-1a
        uint64_t h = 1469598103934665603ULL;
        for (Byte c : b) {
            h ^= c;
            h *= 1099511628211ULL;
        }
        return static_cast<size_t>(h);
    }
};

} // namespace feedroute

#endif // FEEDROUTE_CORE_TYPES_H
