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

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <pdsl/support/types.h>
#include <pdsl/support/string.h>
#include <pdsl/support/exception.h>

namespace pdsl::parse {

/////////////////////////////////////////////////////////////////////////////
/// Cursor over a random-access byte range.
/// - The Scanner does not own or copy the input; the caller must keep the
///   underlying bytes (for example, a memory mapped file) alive.
/// - Matching functions never throw. They either consume input and return
///   true (or a non-empty slice), or leave the cursor unchanged.
/////////////////////////////////////////////////////////////////////////////
class Scanner
{
  public:
    Scanner(const StringView& input) : m_input{input} {}

    char peek() const              { return done()? 0: m_input[m_pos]; }
    char peek(size_t ahead) const  { return (m_pos + ahead < m_input.size())? m_input[m_pos + ahead]: 0; }
    void next()                    { if (!done()) ++m_pos; }
    void next(size_t count)        { m_pos = std::min(m_pos + count, m_input.size()); }
    void seek(size_t pos)          { m_pos = std::min(pos, m_input.size()); }
    size_t consumed() const        { return m_pos; }
    size_t remaining() const       { return m_input.size() - m_pos; }
    bool done() const              { return m_pos >= m_input.size(); }
    const StringView& input() const { return m_input; }

    StringView slice(size_t begin, size_t end) const { return m_input.substr(begin, end - begin); }

    bool match(char c);
    bool match(const StringView& literal);

    template <typename Predicate>
    StringView take_while(Predicate&& pred);

    bool consume_whitespace();
    StringView lexeme() const;

  private:
    bool consume_comment();

  private:
    StringView m_input;
    size_t m_pos = 0;
};


inline
bool Scanner::match(char c) {
    if (done() || m_input[m_pos] != c) return false;
    ++m_pos;
    return true;
}

inline
bool Scanner::match(const StringView& literal) {
    if (m_input.substr(m_pos, literal.size()) != literal) return false;
    m_pos += literal.size();
    return true;
}

template <typename Predicate>
StringView Scanner::take_while(Predicate&& pred) {
    size_t begin = m_pos;
    while (!done() && pred(m_input[m_pos])) ++m_pos;
    return slice(begin, m_pos);
}

/// Skip whitespace and comments.
/// A comment starts with "/*", must be closed by "*/" on the same line, and
/// the remainder of the line after the comment is ignored.
/// @return false, if an unterminated comment was found.  The cursor is left
///         at the beginning of the comment.
inline
bool Scanner::consume_whitespace() {
    while (!done()) {
        char c = m_input[m_pos];
        if (is_space(c)) {
            ++m_pos;
        } else if (c == '/' && peek(1) == '*') {
            if (!consume_comment()) return false;
        } else {
            break;
        }
    }
    return true;
}

inline
bool Scanner::consume_comment() {
    size_t pos = m_pos + 2;
    for (; pos < m_input.size(); ++pos) {
        char c = m_input[pos];
        if (c == '\r' || c == '\n' || c == '\f' || c == '\v') return false;
        if (c == '*' && pos + 1 < m_input.size() && m_input[pos + 1] == '/') break;
    }
    if (pos >= m_input.size()) return false;
    pos += 2;
    while (pos < m_input.size() && m_input[pos] != '\r' && m_input[pos] != '\n') ++pos;
    m_pos = pos;
    return true;
}

/// Return the token at the cursor, for error messages.
/// A token is either a single delimiter character, or a run of characters up
/// to the next whitespace or delimiter.
inline
StringView Scanner::lexeme() const {
    constexpr StringView delimiters = "=,(){}<>\"'^";
    if (done()) return {};
    if (delimiters.find(m_input[m_pos]) != StringView::npos) return m_input.substr(m_pos, 1);
    size_t end = m_pos;
    while (end < m_input.size() && !is_space(m_input[end]) && delimiters.find(m_input[end]) == StringView::npos)
        ++end;
    return slice(m_pos, end);
}


constexpr int syntax_context = 72;

/////////////////////////////////////////////////////////////////////////////
/// Error raised by the label parser.
/// - The parser aborts on the first error, so a ParseError always describes
///   the one place in the input where parsing stopped.
/// - The message includes the line and column, and up to `syntax_context`
///   bytes of the offending line with a marker under the offending byte.
/////////////////////////////////////////////////////////////////////////////
struct ParseError : public PdslException
{
    enum class Kind
    {
        UNEXPECTED_END,     // input ended before the END statement
        EXPECTED_TOKEN,     // a required token, like '=', is missing
        MALFORMED_LITERAL,  // a literal does not match its grammar
        MISMATCHED_BLOCK,   // block terminator does not match the block opened
        INVALID_VALUE       // well-formed literal rejected by value validation
    };

    static std::string_view kind_name(Kind kind) {
        switch (kind) {
            case Kind::UNEXPECTED_END:    return "unexpected end of input";
            case Kind::EXPECTED_TOKEN:    return "expected token missing";
            case Kind::MALFORMED_LITERAL: return "malformed literal";
            case Kind::MISMATCHED_BLOCK:  return "mismatched block terminator";
            case Kind::INVALID_VALUE:     return "invalid value";
            default:                      return "<undefined>";
        }
    }

    static std::string make_message(const std::string_view& input, size_t offset, const std::string& message) {
        offset = std::min(offset, input.size());
        size_t line_begin = input.find_last_of("\r\n", offset == 0? 0: offset - 1);
        line_begin = (line_begin == std::string_view::npos || line_begin >= offset)? 0: line_begin + 1;
        size_t line_end = input.find_first_of("\r\n", offset);
        if (line_end == std::string_view::npos) line_end = input.size();

        size_t line = 1 + std::count(input.begin(), input.begin() + line_begin, '\n');
        size_t column = offset - line_begin + 1;

        size_t ctx_begin = (offset - line_begin > (size_t)syntax_context / 2)? offset - syntax_context / 2: line_begin;
        size_t ctx_end = std::min(ctx_begin + syntax_context, line_end);

        std::stringstream ss;
        ss << message << " at line " << line << ", column " << column << " (offset " << offset << ")" << std::endl;
        for (size_t i = ctx_begin; i < ctx_end; ++i) {
            char c = input[i];
            ss << (is_printable(c)? c: ' ');
        }
        ss << std::endl;
        ss << std::setfill('-') << std::setw(offset - ctx_begin + 1) << '^';
        return ss.str();
    }

    ParseError(Kind kind, const std::string_view& input, size_t offset, const std::string_view& lexeme, const std::string& message)
      : PdslException(make_message(input, offset, message))
      , m_kind{kind}
      , m_offset{offset}
      , m_lexeme{lexeme}
      , m_detail{message} {}

    Kind kind() const                 { return m_kind; }
    size_t offset() const             { return m_offset; }
    const std::string& lexeme() const { return m_lexeme; }

    /// The error message without the position and context lines.
    const std::string& detail() const { return m_detail; }

  private:
    Kind m_kind;
    size_t m_offset;
    std::string m_lexeme;
    std::string m_detail;
};

} // namespace pdsl::parse
