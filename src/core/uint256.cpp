// FEEDROUTE - 256-bit Unsigned Integer Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include "feedroute/core/uint256.h"
#include "feedroute/core/hex.h"

#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace feedroute {

Uint256 Uint256::FromHex(const std::string& hex) {
    std::string h = StripHexPrefix(hex);
    if (h.empty() || h.size() > 64) {
        throw std::invalid_argument("Invalid hex length for Uint256");
    }

    auto hexCharToNibble = [](char c) -> uint64_t {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument("Invalid hex character");
    };

    Uint256 result;
    // Least significant digit is the last character
    for (size_t i = 0; i < h.size(); ++i) {
        uint64_t nibble = hexCharToNibble(h[h.size() - 1 - i]);
        result.limbs[i / 16] |= nibble << ((i % 16) * 4);
    }
    return result;
}

Uint256 Uint256::FromDecimal(const std::string& dec) {
    if (dec.empty()) {
        throw std::invalid_argument("Empty decimal string");
    }

    Uint256 result;
    for (char c : dec) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid decimal character");
        }
        bool overflow = false;
        result = MulSmall(result, 10, overflow);
        bool carry = false;
        result = Add(result, Uint256(static_cast<uint64_t>(c - '0')), carry);
        if (overflow || carry) {
            throw std::overflow_error("Decimal value exceeds 256 bits");
        }
    }
    return result;
}

std::string Uint256::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(64);

    // Output from most significant limb to least
    for (int i = 3; i >= 0; --i) {
        for (int j = 56; j >= 0; j -= 8) {
            uint8_t byte = (limbs[i] >> j) & 0xFF;
            result.push_back(hexChars[byte >> 4]);
            result.push_back(hexChars[byte & 0x0F]);
        }
    }

    return result;
}

std::string Uint256::ToString() const {
    if (IsZero()) {
        return "0";
    }

    std::string digits;
    Uint256 v = *this;
    while (!v.IsZero()) {
        uint64_t rem = 0;
        v = DivSmall(v, 10, rem);
        digits.push_back(static_cast<char>('0' + rem));
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::array<Byte, 32> Uint256::ToBigEndian() const {
    std::array<Byte, 32> result;
    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 8; ++j) {
            result[31 - (i * 8 + j)] = static_cast<Byte>((limbs[i] >> (j * 8)) & 0xFF);
        }
    }
    return result;
}

bool Uint256::IsZero() const {
    return limbs[0] == 0 && limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0;
}

bool Uint256::operator==(const Uint256& other) const {
    return limbs == other.limbs;
}

bool Uint256::operator!=(const Uint256& other) const {
    return !(*this == other);
}

bool Uint256::operator<(const Uint256& other) const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] < other.limbs[i]) return true;
        if (limbs[i] > other.limbs[i]) return false;
    }
    return false;
}

bool Uint256::operator<=(const Uint256& other) const {
    return !(other < *this);
}

bool Uint256::operator>(const Uint256& other) const {
    return other < *this;
}

bool Uint256::operator>=(const Uint256& other) const {
    return !(*this < other);
}

Uint256 Uint256::Add(const Uint256& a, const Uint256& b, bool& carry) {
    Uint256 result;
    uint64_t c = 0;

    for (int i = 0; i < 4; ++i) {
        __uint128_t sum = static_cast<__uint128_t>(a.limbs[i]) +
                          static_cast<__uint128_t>(b.limbs[i]) + c;
        result.limbs[i] = static_cast<uint64_t>(sum);
        c = static_cast<uint64_t>(sum >> 64);
    }

    carry = (c != 0);
    return result;
}

Uint256 Uint256::Sub(const Uint256& a, const Uint256& b, bool& borrow) {
    Uint256 result;
    uint64_t bw = 0;

    for (int i = 0; i < 4; ++i) {
        __uint128_t diff = static_cast<__uint128_t>(a.limbs[i]) -
                           static_cast<__uint128_t>(b.limbs[i]) - bw;
        result.limbs[i] = static_cast<uint64_t>(diff);
        bw = static_cast<uint64_t>((diff >> 127) & 1);
    }

    borrow = (bw != 0);
    return result;
}

Uint256 Uint256::Mul(const Uint256& a, const Uint256& b, Uint256& high) {
    // Schoolbook multiplication, 512-bit intermediate
    __uint128_t products[8] = {0};

    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 4; ++j) {
            __uint128_t prod = static_cast<__uint128_t>(a.limbs[i]) *
                               static_cast<__uint128_t>(b.limbs[j]);
            int k = i + j;
            products[k] += prod & 0xFFFFFFFFFFFFFFFFULL;
            products[k + 1] += prod >> 64;
        }
    }

    uint64_t result[8];
    __uint128_t carry = 0;
    for (int i = 0; i < 8; ++i) {
        __uint128_t sum = products[i] + carry;
        result[i] = static_cast<uint64_t>(sum);
        carry = sum >> 64;
    }

    high = Uint256(result[4], result[5], result[6], result[7]);
    return Uint256(result[0], result[1], result[2], result[3]);
}

Uint256 Uint256::MulSmall(const Uint256& a, uint64_t b, bool& overflow) {
    Uint256 result;
    uint64_t carry = 0;

    for (int i = 0; i < 4; ++i) {
        __uint128_t prod = static_cast<__uint128_t>(a.limbs[i]) * b + carry;
        result.limbs[i] = static_cast<uint64_t>(prod);
        carry = static_cast<uint64_t>(prod >> 64);
    }

    overflow = (carry != 0);
    return result;
}

Uint256 Uint256::DivSmall(const Uint256& a, uint64_t divisor, uint64_t& remainder) {
    if (divisor == 0) {
        throw std::domain_error("Division by zero");
    }

    Uint256 result;
    __uint128_t rem = 0;
    for (int i = 3; i >= 0; --i) {
        __uint128_t cur = (rem << 64) | a.limbs[i];
        result.limbs[i] = static_cast<uint64_t>(cur / divisor);
        rem = cur % divisor;
    }

    remainder = static_cast<uint64_t>(rem);
    return result;
}

std::ostream& operator<<(std::ostream& os, const Uint256& value) {
    return os << value.ToString();
}

} // namespace feedroute
