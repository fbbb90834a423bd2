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

#include <ostream>

#include <pdsl/core/Identifier.h>
#include <pdsl/support/types.h>
#include <pdsl/support/string.h>
#include <pdsl/support/exception.h>

namespace pdsl {

/////////////////////////////////////////////////////////////////////////////
/// A units expression attached to a numeric value.
/// - Grammar: `factor (('*' | '/') factor)*`, where
///   `factor = name ('**' ['+'|'-'] digit+)?` and `name` follows the
///   identifier name rules.
/// - The expression is stored in upper-case, without the angle brackets.
/////////////////////////////////////////////////////////////////////////////
class Units
{
  public:
    Units(const StringView& expression);
    Units(const String& expression) : Units(StringView{expression}) {}
    Units(const char* expression)   : Units(StringView{expression}) {}

    static bool is_valid(const StringView& expression);

    const String& expression() const { return m_expression; }
    String to_str() const            { return "<" + m_expression + ">"; }

    bool operator == (const Units& other) const { return m_expression == other.m_expression; }

  private:
    static bool match_factor(const StringView& expression, size_t& pos);

  private:
    String m_expression;
};


inline
Units::Units(const StringView& expression) {
    if (!is_valid(expression))
        throw ValidationError("invalid units expression " + quoted(expression));
    m_expression = to_upper(expression);
}

inline
bool Units::match_factor(const StringView& expression, size_t& pos) {
    size_t begin = pos;
    while (pos < expression.size() && (is_alnum(expression[pos]) || expression[pos] == '_')) ++pos;
    if (!Identifier::is_valid_name(expression.substr(begin, pos - begin))) return false;

    if (expression.substr(pos, 2) == "**") {
        pos += 2;
        if (pos < expression.size() && (expression[pos] == '+' || expression[pos] == '-')) ++pos;
        size_t digits = pos;
        while (pos < expression.size() && is_digit(expression[pos])) ++pos;
        if (pos == digits) return false;
    }
    return true;
}

inline
bool Units::is_valid(const StringView& expression) {
    size_t pos = 0;
    if (!match_factor(expression, pos)) return false;
    while (pos < expression.size()) {
        char op = expression[pos++];
        if (op != '*' && op != '/') return false;
        if (!match_factor(expression, pos)) return false;
    }
    return true;
}

inline
std::ostream& operator<< (std::ostream& ostream, const Units& units) {
    return ostream << units.to_str();
}

} // namespace pdsl
