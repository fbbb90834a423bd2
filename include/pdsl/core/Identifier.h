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

#include <array>
#include <functional>
#include <ostream>

#include <pdsl/support/types.h>
#include <pdsl/support/string.h>
#include <pdsl/support/exception.h>

namespace pdsl {

/////////////////////////////////////////////////////////////////////////////
/// A statement or value identifier.
/// - A name is a letter followed by letters, digits, and single underscores,
///   and does not end with an underscore: `letter ('_'? (letter|digit))*`.
/// - An identifier is a name with an optional leading `^` (pointer), or an
///   optional `namespace:` prefix, or both (`^NS:NAME`).
/// - The reserved words END, GROUP, BEGIN_GROUP, END_GROUP, OBJECT,
///   BEGIN_OBJECT, and END_OBJECT are not valid names.
/// - Identifiers are folded to upper-case on construction, so equality and
///   hashing are case-insensitive with respect to the original text.
/////////////////////////////////////////////////////////////////////////////
class Identifier
{
  public:
    Identifier(const StringView& text);
    Identifier(const String& text) : Identifier(StringView{text}) {}
    Identifier(const char* text)   : Identifier(StringView{text}) {}

    static bool is_reserved(const StringView& name);
    static bool is_valid_name(const StringView& name);

    const String& to_str() const { return m_text; }

    bool is_pointer() const { return !m_text.empty() && m_text[0] == '^'; }
    bool has_namespace() const { return m_name_pos > (is_pointer()? 1: 0); }
    bool is_plain() const { return m_name_pos == 0; }

    /// The namespace prefix, without the colon, or an empty string.
    StringView ns() const;

    /// The name, without the pointer marker or namespace prefix.
    StringView name() const { return StringView{m_text}.substr(m_name_pos); }

    bool operator == (const Identifier& other) const { return m_text == other.m_text; }

    size_t hash() const { return std::hash<String>{}(m_text); }

  private:
    String m_text;
    size_t m_name_pos = 0;
};


inline
bool Identifier::is_reserved(const StringView& name) {
    static const std::array<StringView, 7> reserved = {
        "END", "GROUP", "BEGIN_GROUP", "END_GROUP", "OBJECT", "BEGIN_OBJECT", "END_OBJECT"
    };
    for (auto& word : reserved)
        if (iequal(word, name)) return true;
    return false;
}

inline
bool Identifier::is_valid_name(const StringView& name) {
    if (name.empty() || !is_letter(name[0])) return false;
    for (size_t i = 1; i < name.size(); ++i) {
        char c = name[i];
        if (c == '_') {
            if (i + 1 == name.size() || !is_alnum(name[i + 1])) return false;
        } else if (!is_alnum(c)) {
            return false;
        }
    }
    return !is_reserved(name);
}

inline
Identifier::Identifier(const StringView& text) {
    StringView rest = text;
    size_t name_pos = 0;

    if (!rest.empty() && rest[0] == '^') {
        rest.remove_prefix(1);
        name_pos = 1;
    }

    auto colon = rest.find(':');
    if (colon != StringView::npos) {
        if (!is_valid_name(rest.substr(0, colon)))
            throw ValidationError("invalid identifier namespace " + quoted(text));
        name_pos += colon + 1;
        rest.remove_prefix(colon + 1);
    }

    if (!is_valid_name(rest))
        throw ValidationError("invalid identifier " + quoted(text));

    m_text = to_upper(text);
    m_name_pos = name_pos;
}

inline
StringView Identifier::ns() const {
    if (!has_namespace()) return {};
    size_t begin = is_pointer()? 1: 0;
    return StringView{m_text}.substr(begin, m_name_pos - begin - 1);
}

inline
std::ostream& operator<< (std::ostream& ostream, const Identifier& identifier) {
    return ostream << identifier.to_str();
}

} // namespace pdsl


namespace std {

template<>
struct hash<pdsl::Identifier>
{
    std::size_t operator () (const pdsl::Identifier& identifier) const noexcept {
      return identifier.hash();
    }
};

} // namespace std
