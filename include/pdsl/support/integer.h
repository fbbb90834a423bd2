// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <limits>
#include <vector>
#include <cstdio>
#include <functional>

#include <pdsl/support/types.h>
#include <pdsl/support/string.h>
#include <pdsl/support/exception.h>

namespace pdsl {

/// Return the value of an alphanumeric digit (0-35), or -1.
inline
int digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'z') return c - 'a' + 10;
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    return -1;
}

/////////////////////////////////////////////////////////////////////////////
/// Arbitrary precision signed integer.
/// - The magnitude is stored as little-endian base 10^9 limbs, so that
///   conversion to and from decimal text is cheap.
/// - Zero is always non-negative and has no limbs.
/// - Only the operations needed to build integers from digit strings and to
///   render them are provided; this is not a general arithmetic type.
/////////////////////////////////////////////////////////////////////////////
class BigInt
{
  public:
    static constexpr uint32_t BASE = 1000000000u;

    BigInt() = default;

    BigInt(is_like_Int auto v) : m_negative{v < 0} {
        // negate in unsigned arithmetic so that the minimum value does not overflow
        UInt mag = (v < 0)? (UInt)(-(v + 1)) + 1: (UInt)v;
        while (mag) {
            m_limbs.push_back((uint32_t)(mag % BASE));
            mag /= BASE;
        }
    }

    static BigInt from_digits(const StringView& digits, unsigned radix = 10);
    static BigInt from_str(const StringView& str, unsigned radix = 10);

    bool is_zero() const     { return m_limbs.empty(); }
    bool is_negative() const { return m_negative; }

    bool fits_int() const;
    Int to_int() const;
    Float to_float() const;
    String to_str() const;

    BigInt operator - () const;

    bool operator == (const BigInt& other) const {
        return m_negative == other.m_negative && m_limbs == other.m_limbs;
    }

    size_t hash() const {
        size_t h = m_negative? 0x9e3779b97f4a7c15ULL: 0;
        for (auto limb : m_limbs)
            h ^= std::hash<uint32_t>{}(limb) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }

  private:
    void mul_add(uint32_t mul, uint32_t add);
    bool to_magnitude(UInt& mag) const;
    void trim();

  private:
    bool m_negative = false;
    std::vector<uint32_t> m_limbs;
};


/// Build a non-negative integer from an unsigned digit string.
/// @param digits Digits valid for `radix`, in either letter case.
/// @param radix Integer base, 2 to 36.
/// @throw ValidationError if the string is empty or contains an invalid digit.
inline
BigInt BigInt::from_digits(const StringView& digits, unsigned radix) {
    if (radix < 2 || radix > 36)
        throw ValidationError("radix " + int_to_str(radix) + " is not between 2 and 36");
    if (digits.empty())
        throw ValidationError("empty digit string");

    BigInt result;
    for (char c : digits) {
        int d = digit_value(c);
        if (d < 0 || (unsigned)d >= radix)
            throw ValidationError("invalid digit " + quoted(StringView{&c, 1}) + " for radix " + int_to_str(radix));
        result.mul_add(radix, (uint32_t)d);
    }
    result.trim();
    return result;
}

/// Build an integer from a digit string with an optional leading sign.
inline
BigInt BigInt::from_str(const StringView& str, unsigned radix) {
    bool negative = false;
    StringView digits = str;
    if (!digits.empty() && (digits[0] == '+' || digits[0] == '-')) {
        negative = digits[0] == '-';
        digits.remove_prefix(1);
    }
    BigInt result = from_digits(digits, radix);
    result.m_negative = negative && !result.is_zero();
    return result;
}

inline
bool BigInt::to_magnitude(UInt& mag) const {
    mag = 0;
    for (auto it = m_limbs.rbegin(); it != m_limbs.rend(); ++it) {
        if (mag > (std::numeric_limits<UInt>::max() - *it) / BASE) return false;
        mag = mag * BASE + *it;
    }
    return true;
}

inline
bool BigInt::fits_int() const {
    UInt mag;
    if (!to_magnitude(mag)) return false;
    constexpr UInt max = (UInt)std::numeric_limits<Int>::max();
    return m_negative? mag <= max + 1: mag <= max;
}

/// Convert to a 64-bit signed integer.
/// @throw ValidationError if the value does not fit.
inline
Int BigInt::to_int() const {
    if (!fits_int())
        throw ValidationError(to_str() + " does not fit in a 64-bit integer");
    UInt mag;
    to_magnitude(mag);
    return m_negative? -(Int)(mag - 1) - 1: (Int)mag;
}

inline
Float BigInt::to_float() const {
    // round through the decimal text, which gives a correctly rounded result
    Float value = 0;
    if (!str_to_float(to_str(), value))
        return m_negative? -std::numeric_limits<Float>::infinity(): std::numeric_limits<Float>::infinity();
    return value;
}

inline
String BigInt::to_str() const {
    if (is_zero()) return "0";
    String str = m_negative? "-": "";
    str += std::to_string(m_limbs.back());
    char buf[16];
    for (size_t i = m_limbs.size() - 1; i-- > 0;) {
        std::snprintf(buf, sizeof(buf), "%09u", m_limbs[i]);
        str += buf;
    }
    return str;
}

inline
BigInt BigInt::operator - () const {
    BigInt result = *this;
    result.m_negative = !m_negative && !is_zero();
    return result;
}

// n = n * mul + add
inline
void BigInt::mul_add(uint32_t mul, uint32_t add) {
    uint64_t carry = add;
    for (auto& limb : m_limbs) {
        uint64_t v = uint64_t(limb) * mul + carry;
        limb = uint32_t(v % BASE);
        carry = v / BASE;
    }
    while (carry) {
        m_limbs.push_back(uint32_t(carry % BASE));
        carry /= BASE;
    }
}

inline
void BigInt::trim() {
    while (!m_limbs.empty() && m_limbs.back() == 0) m_limbs.pop_back();
    if (m_limbs.empty()) m_negative = false;
}

} // namespace pdsl
