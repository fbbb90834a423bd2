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

#include <string>
#include <charconv>
#include <iomanip>
#include <array>

#include <pdsl/support/types.h>
#include <pdsl/support/exception.h>

namespace pdsl {

// The label grammar is defined over ASCII only, so the <cctype> functions,
// which depend on the current locale, are not used.
inline bool is_letter(char c)    { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
inline bool is_digit(char c)     { return c >= '0' && c <= '9'; }
inline bool is_alnum(char c)     { return is_letter(c) || is_digit(c); }
inline bool is_ascii(char c)     { return (unsigned char)c < 0x80; }
inline bool is_printable(char c) { return c >= 0x20 && c <= 0x7e; }
inline bool is_space(char c)     { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f'; }

inline
char to_upper(char c) {
    return (c >= 'a' && c <= 'z')? (char)(c - 'a' + 'A'): c;
}

inline
String to_upper(const StringView& str) {
    String result{str};
    for (auto& c : result) c = to_upper(c);
    return result;
}

inline
bool iequal(const StringView& a, const StringView& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
        if (to_upper(a[i]) != to_upper(b[i])) return false;
    return true;
}

// string quoting, for error messages
inline
String quoted(const StringView& str) {
  StringStream ss;
  ss << std::quoted(str);
  return ss.str();
}

inline
String int_to_str(Int v) {
    std::array<char, 24> buf;
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v);
    PDSL_ASSERT(ec == std::errc());
    return {buf.data(), ptr};
}

/// Return the shortest decimal string that reads back as exactly `v`.
/// @param fixed If true, never use exponent notation.
inline
String float_to_str(Float v, bool fixed = false) {
    // fixed notation of a double may need up to ~330 digits
    std::array<char, 400> buf;
    auto [ptr, ec] = fixed? std::to_chars(buf.data(), buf.data() + buf.size(), v, std::chars_format::fixed):
                            std::to_chars(buf.data(), buf.data() + buf.size(), v);
    PDSL_ASSERT(ec == std::errc());
    return {buf.data(), ptr};
}

/// Convert a decimal real literal to Float.
/// @return false, if the whole string is not a literal, or is out of range.
inline
bool str_to_float(const StringView& str, Float& value) {
    const char* beg = str.data();
    const char* end = beg + str.size();
    if (beg != end && *beg == '+') {
        ++beg;  // from_chars rejects an explicit plus sign
        if (beg != end && *beg == '-') return false;
    }
    auto [ptr, ec] = std::from_chars(beg, end, value);
    return ec == std::errc() && ptr == end;
}

inline
String pad_right(const StringView& str, size_t width) {
    String result{str};
    if (result.size() < width) result.append(width - result.size(), ' ');
    return result;
}

} // pdsl namespace
