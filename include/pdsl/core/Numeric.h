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

#include <cmath>
#include <optional>
#include <fmt/format.h>

#include "Units.h"

#include <pdsl/support/types.h>
#include <pdsl/support/string.h>
#include <pdsl/support/integer.h>
#include <pdsl/support/exception.h>

namespace pdsl {

using OptionalUnits = std::optional<Units>;

inline
String units_suffix(const OptionalUnits& units) {
    return units? " " + units->to_str(): String{};
}


/////////////////////////////////////////////////////////////////////////////
/// A base-10 integer of unlimited precision, with optional units.
/////////////////////////////////////////////////////////////////////////////
class Integer
{
  public:
    Integer(const BigInt& value, const OptionalUnits& units = std::nullopt) : m_value{value}, m_units{units} {}
    Integer(BigInt&& value, const OptionalUnits& units = std::nullopt) : m_value{std::move(value)}, m_units{units} {}
    Integer(is_like_Int auto value, const OptionalUnits& units = std::nullopt) : m_value{value}, m_units{units} {}

    const BigInt& value() const        { return m_value; }
    const OptionalUnits& units() const { return m_units; }

    Int to_int() const     { return m_value.to_int(); }
    Float to_float() const { return m_value.to_float(); }
    String to_str() const  { return m_value.to_str() + units_suffix(m_units); }

    bool operator == (const Integer& other) const = default;

    size_t hash() const { return m_value.hash() ^ (m_units? std::hash<String>{}(m_units->expression()): 0); }

  private:
    BigInt m_value;
    OptionalUnits m_units;
};


/////////////////////////////////////////////////////////////////////////////
/// An integer written in an explicit radix, like `16#4B#`.
/// - The radix and digit string are kept exactly as given, so that the value
///   renders the way it was written.
/// - The digit string may begin with a sign.
/// - The base-10 value is computed once, on construction.
/// - Two based integers are equal when their radix, value, and units are
///   equal; the letter case of the digits does not matter.
/////////////////////////////////////////////////////////////////////////////
class BasedInteger
{
  public:
    BasedInteger(int radix, const StringView& digits, const OptionalUnits& units = std::nullopt);

    int radix() const                  { return m_radix; }
    const String& digits() const       { return m_digits; }
    const BigInt& value() const        { return m_value; }
    const OptionalUnits& units() const { return m_units; }

    Int to_int() const     { return m_value.to_int(); }
    Float to_float() const { return m_value.to_float(); }
    String to_str() const  { return fmt::format("{}#{}#", m_radix, m_digits) + units_suffix(m_units); }

    bool operator == (const BasedInteger& other) const {
        return m_radix == other.m_radix && m_value == other.m_value && m_units == other.m_units;
    }

  private:
    int m_radix;
    String m_digits;
    BigInt m_value;
    OptionalUnits m_units;
};

inline
BasedInteger::BasedInteger(int radix, const StringView& digits, const OptionalUnits& units)
  : m_radix{radix}
  , m_digits{digits}
  , m_units{units}
{
    if (radix < 2 || radix > 16)
        throw ValidationError(fmt::format("radix {} is not between 2 and 16", radix));
    m_value = BigInt::from_str(digits, radix);
}


/////////////////////////////////////////////////////////////////////////////
/// A finite floating point value, with optional units.
/////////////////////////////////////////////////////////////////////////////
class Real
{
  public:
    Real(Float value, const OptionalUnits& units = std::nullopt) : m_value{value}, m_units{units} {
        if (!std::isfinite(value))
            throw ValidationError("real value is not finite");
    }

    Float value() const                { return m_value; }
    const OptionalUnits& units() const { return m_units; }

    Int to_int() const;
    Float to_float() const { return m_value; }
    String to_str() const;

    bool operator == (const Real& other) const = default;

  private:
    Float m_value;
    OptionalUnits m_units;
};

/// Truncate toward zero.
/// @throw ValidationError, if the truncated value does not fit in an Int.
inline
Int Real::to_int() const {
    if (!(m_value >= -9223372036854775808.0 && m_value < 9223372036854775808.0))
        throw ValidationError(float_to_str(m_value) + " does not fit in a 64-bit integer");
    return (Int)m_value;
}

/// Render the shortest text that reads back as the same value, with at least
/// one fractional digit, so the text is never mistaken for an integer.
inline
String Real::to_str() const {
    String str = float_to_str(m_value);
    auto exp = str.find_first_of("eE");
    auto mantissa_end = (exp == String::npos)? str.size(): exp;
    if (str.find('.') == String::npos)
        str.insert(mantissa_end, ".0");
    return str + units_suffix(m_units);
}

} // namespace pdsl
