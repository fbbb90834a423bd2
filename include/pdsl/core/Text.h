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

#include <pdsl/support/types.h>
#include <pdsl/support/string.h>
#include <pdsl/support/exception.h>

namespace pdsl {

/////////////////////////////////////////////////////////////////////////////
/// A quoted text string.
/// - Any ASCII byte, including control characters and line breaks, is
///   allowed, except the double-quote.
/// - The content is stored and rendered unmodified.
/////////////////////////////////////////////////////////////////////////////
class Text
{
  public:
    Text(const StringView& value) : m_value{value} {
        if (!is_valid(value))
            throw ValidationError("invalid text " + quoted(value));
    }
    Text(const String& value) : Text(StringView{value}) {}
    Text(const char* value)   : Text(StringView{value}) {}

    static bool is_valid(const StringView& value) {
        for (auto c : value)
            if (!is_ascii(c) || c == '"') return false;
        return true;
    }

    const String& value() const { return m_value; }
    String to_str() const       { return '"' + m_value + '"'; }

    bool operator == (const Text& other) const = default;

  private:
    String m_value;
};


/////////////////////////////////////////////////////////////////////////////
/// A quoted symbol.
/// - One or more printable ASCII characters, except the apostrophe.
/// - Folded to upper-case on construction.
/////////////////////////////////////////////////////////////////////////////
class Symbol
{
  public:
    Symbol(const StringView& value) {
        if (!is_valid(value))
            throw ValidationError("invalid symbol " + quoted(value));
        m_value = to_upper(value);
    }
    Symbol(const String& value) : Symbol(StringView{value}) {}
    Symbol(const char* value)   : Symbol(StringView{value}) {}

    static bool is_valid(const StringView& value) {
        if (value.empty()) return false;
        for (auto c : value)
            if (!is_printable(c) || c == '\'') return false;
        return true;
    }

    const String& value() const { return m_value; }
    String to_str() const       { return '\'' + m_value + '\''; }

    bool operator == (const Symbol& other) const = default;

    size_t hash() const { return std::hash<String>{}(m_value); }

  private:
    String m_value;
};

} // namespace pdsl
