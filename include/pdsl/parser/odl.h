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

#include <optional>
#include <fmt/format.h>

#include <pdsl/core/Statement.h>
#include <pdsl/support/parse.h>
#include <pdsl/support/string.h>
#include <pdsl/support/logging.h>
#include <pdsl/support/exception.h>

namespace pdsl::odl {

using ParseError = parse::ParseError;

struct Options
{
    size_t max_depth = 0;  // maximum GROUP/OBJECT nesting, or 0 for unlimited
};


namespace impl {

using Kind = ParseError::Kind;

struct BlockEnd
{
    StringView keyword;
    const Identifier& name;
};

inline bool is_name_char(char c)       { return is_alnum(c) || c == '_'; }
inline bool is_blank(char c)           { return c == ' ' || c == '\t' || c == '\v' || c == '\f'; }
inline bool is_numeric_char(char c)    { return is_alnum(c) || c == '.' || c == ':' || c == '#' || c == '+' || c == '-'; }

/////////////////////////////////////////////////////////////////////////////
/// Recursive descent parser for a single label.
/// - Parsing stops at the END statement; nothing after it is examined.
/// - The first error stops the parse, and is available from `error()`.
/////////////////////////////////////////////////////////////////////////////
class Parser
{
  public:
    Parser(const Options& options, const StringView& input) : m_options{options}, m_it{input} {}

    Parser(const Parser&) = delete;
    auto operator = (const Parser&) = delete;

    std::optional<Label> parse_label();

    const std::optional<ParseError>& error() const { return m_error; }

  private:
    template <class Kinds>
    bool parse_block(Statements<Kinds>& block, size_t depth, const BlockEnd* block_end);

    template <class Kinds, class Nested>
    bool parse_nested(Statements<Kinds>& block, size_t depth, size_t stmt_pos);

    bool parse_block_end(const BlockEnd& block_end);

    std::optional<Value> parse_value();
    std::optional<Scalar> parse_scalar();
    std::optional<Scalar> parse_numeric();
    std::optional<Scalar> parse_text();
    std::optional<Scalar> parse_symbol();
    std::optional<Scalar> parse_identifier_value();
    std::optional<Sequence1D> parse_sequence_1d();
    std::optional<Value> parse_sequence();
    std::optional<Value> parse_set();
    bool parse_units(OptionalUnits& units);

    std::optional<Identifier> parse_identifier();
    String read_identifier();
    StringView read_word();
    bool expect(char c, const char* what);
    bool skip_whitespace();

    void set_error(Kind kind, size_t offset, const std::string& message);
    void set_error(Kind kind, size_t offset, const StringView& lexeme, const std::string& message);

    template <typename Make>
    auto validate(Kind kind, size_t offset, const StringView& lexeme, Make&& make) -> std::optional<decltype(make())>;

  private:
    Options m_options;
    parse::Scanner m_it;
    std::optional<ParseError> m_error;
};


/////////////////////////////////////////////////////////////////////////////
/// Helpers that match the calendar and numeric literal grammars against a
/// complete word.  Each returns false, without throwing, if the word does
/// not match; range checks are left to the value constructors.
/////////////////////////////////////////////////////////////////////////////
struct DateFields  { int year; std::optional<int> month; int day; };
struct TimeFields  { int hour; int minute; std::optional<Float> second; bool utc = false;
                     std::optional<int> zone_hour; std::optional<int> zone_minute; };

inline
bool read_int(parse::Scanner& s, int& value) {
    auto digits = s.take_while(is_digit);
    if (digits.empty() || digits.size() > 9) return false;
    value = 0;
    for (auto c : digits) value = value * 10 + (c - '0');
    return true;
}

inline
bool match_date(const StringView& word, DateFields& fields) {
    parse::Scanner s{word};
    int first, second;
    if (!read_int(s, fields.year) || !s.match('-') || !read_int(s, first)) return false;
    if (s.match('-')) {
        if (!read_int(s, second)) return false;
        fields.month = first;
        fields.day = second;
    } else {
        fields.month = std::nullopt;
        fields.day = first;
    }
    return s.done();
}

inline
bool match_time(const StringView& word, TimeFields& fields) {
    parse::Scanner s{word};
    if (!read_int(s, fields.hour) || !s.match(':') || !read_int(s, fields.minute)) return false;

    if (s.match(':')) {
        size_t begin = s.consumed();
        auto int_part = s.take_while(is_digit);
        size_t frac_digits = 0;
        if (s.match('.')) frac_digits = s.take_while(is_digit).size();
        if (int_part.empty() && frac_digits == 0) return false;
        Float second;
        if (!str_to_float(s.slice(begin, s.consumed()), second)) return false;
        fields.second = second;
    }

    if (s.match('Z') || s.match('z')) {
        fields.utc = true;
    } else if (s.peek() == '+' || s.peek() == '-') {
        int sign = (s.peek() == '-')? -1: 1;
        s.next();
        int zone_hour, zone_minute;
        if (!read_int(s, zone_hour)) return false;
        fields.zone_hour = sign * zone_hour;
        if (s.match(':')) {
            if (!read_int(s, zone_minute)) return false;
            fields.zone_minute = zone_minute;
        }
    }

    return s.done();
}

inline
bool match_based(const StringView& word, int& radix, StringView& digits) {
    parse::Scanner s{word};
    if (!read_int(s, radix) || !s.match('#')) return false;
    size_t begin = s.consumed();
    if (!s.match('+')) s.match('-');
    if (s.take_while(is_alnum).empty()) return false;
    digits = s.slice(begin, s.consumed());
    return s.match('#') && s.done();
}

inline
bool match_real(const StringView& word) {
    parse::Scanner s{word};
    if (!s.match('+')) s.match('-');
    bool int_digits = !s.take_while(is_digit).empty();
    bool has_dot = s.match('.');
    bool frac_digits = has_dot && !s.take_while(is_digit).empty();
    if (!int_digits && !frac_digits) return false;
    bool has_exp = false;
    if (int_digits && (s.match('e') || s.match('E'))) {
        if (!s.match('+')) s.match('-');
        if (s.take_while(is_digit).empty()) return false;
        has_exp = true;
    }
    return (has_dot || has_exp) && s.done();
}

inline
bool match_integer(const StringView& word) {
    parse::Scanner s{word};
    if (!s.match('+')) s.match('-');
    return !s.take_while(is_digit).empty() && s.done();
}


inline
std::optional<Label> Parser::parse_label() {
    Label label;
    if (!parse_block(label, 0, nullptr)) return std::nullopt;
    PDSL_DEBUG("accepted label: {} statements, END at offset {}, {} trailing bytes ignored",
               label.size(), m_it.consumed() - 3, m_it.remaining());
    return label;
}

template <class Kinds>
bool Parser::parse_block(Statements<Kinds>& block, size_t depth, const BlockEnd* block_end) {
    while (true) {
        if (!skip_whitespace()) return false;

        size_t stmt_pos = m_it.consumed();
        if (m_it.done()) {
            set_error(Kind::UNEXPECTED_END, stmt_pos,
                      block_end? fmt::format("expected {}", block_end->keyword): String{"expected END statement"});
            return false;
        }

        auto word = read_identifier();
        if (word.empty()) {
            set_error(Kind::EXPECTED_TOKEN, stmt_pos, "expected identifier");
            return false;
        }

        auto keyword = to_upper(word);
        if (keyword == "END") {
            if (block_end) {
                set_error(Kind::MISMATCHED_BLOCK, stmt_pos, word, fmt::format("expected {} before END", block_end->keyword));
                return false;
            }
            return true;
        }

        if (keyword == "END_GROUP" || keyword == "END_OBJECT") {
            if (!block_end || keyword != block_end->keyword) {
                set_error(Kind::MISMATCHED_BLOCK, stmt_pos, word, fmt::format("{} does not close an open block", keyword));
                return false;
            }
            return parse_block_end(*block_end);
        }

        if (keyword == "GROUP" || keyword == "BEGIN_GROUP") {
            if (!parse_nested<Kinds, GroupKinds>(block, depth, stmt_pos)) return false;
            continue;
        }

        if (keyword == "OBJECT" || keyword == "BEGIN_OBJECT") {
            if (!parse_nested<Kinds, ObjectKinds>(block, depth, stmt_pos)) return false;
            continue;
        }

        auto identifier = validate(Kind::INVALID_VALUE, stmt_pos, word, [word] () { return Identifier{word}; });
        if (!identifier) return false;

        if (!skip_whitespace() || !expect('=', "'='")) return false;

        auto value = parse_value();
        if (!value) return false;

        block.append(Attribute{*identifier, *value});
    }
}

template <class Kinds, class Nested>
bool Parser::parse_nested(Statements<Kinds>& block, size_t depth, size_t stmt_pos) {
    constexpr bool is_group = std::is_same_v<Nested, GroupKinds>;
    constexpr StatementKind kind = is_group? GROUP: OBJECT;

    if (!(Kinds::allowed & kind)) {
        set_error(Kind::INVALID_VALUE, stmt_pos, fmt::format("{} cannot contain {} statement", Kinds::name, Nested::name));
        return false;
    }

    if (m_options.max_depth > 0 && depth + 1 > m_options.max_depth) {
        set_error(Kind::INVALID_VALUE, stmt_pos, "nesting too deep");
        return false;
    }

    if (!skip_whitespace() || !expect('=', "'='")) return false;
    if (!skip_whitespace()) return false;

    size_t name_pos = m_it.consumed();
    auto name = parse_identifier();
    if (!name) return false;
    if (!name->is_plain()) {
        set_error(Kind::INVALID_VALUE, name_pos, fmt::format("{} identifier must be a plain name", Nested::name));
        return false;
    }

    Statements<Nested> statements;
    BlockEnd block_end{is_group? "END_GROUP": "END_OBJECT", *name};
    if (!parse_block(statements, depth + 1, &block_end)) return false;

    if constexpr (is_group) block.append(Group{*name, std::move(statements)});
    else block.append(Object{*name, std::move(statements)});
    return true;
}

/// Parse the optional `= NAME` after END_GROUP or END_OBJECT.
inline
bool Parser::parse_block_end(const BlockEnd& block_end) {
    size_t pos = m_it.consumed();
    if (!skip_whitespace()) return false;
    if (!m_it.match('=')) {
        m_it.seek(pos);
        return true;
    }

    if (!skip_whitespace()) return false;
    size_t name_pos = m_it.consumed();
    auto name = parse_identifier();
    if (!name) return false;
    if (!(*name == block_end.name)) {
        set_error(Kind::MISMATCHED_BLOCK, name_pos, name->to_str(),
                  fmt::format("{} {} does not match {}", block_end.keyword, name->to_str(), block_end.name.to_str()));
        return false;
    }
    return true;
}

inline
std::optional<Value> Parser::parse_value() {
    if (!skip_whitespace()) return std::nullopt;
    switch (m_it.peek()) {
        case '(': return parse_sequence();
        case '{': return parse_set();
        default: {
            auto scalar = parse_scalar();
            if (!scalar) return std::nullopt;
            return Value{*scalar};
        }
    }
}

inline
std::optional<Scalar> Parser::parse_scalar() {
    if (!skip_whitespace()) return std::nullopt;
    if (m_it.done()) {
        set_error(Kind::UNEXPECTED_END, m_it.consumed(), "expected value");
        return std::nullopt;
    }

    char c = m_it.peek();
    if (c == '"') return parse_text();
    if (c == '\'') return parse_symbol();
    if (is_digit(c) || c == '+' || c == '-' || c == '.') return parse_numeric();
    if (is_letter(c) || c == '^') return parse_identifier_value();

    set_error(Kind::EXPECTED_TOKEN, m_it.consumed(), "expected value");
    return std::nullopt;
}

/// Classify a numeric or calendar word, trying in order: date-time, time,
/// date, based integer, real, integer.
inline
std::optional<Scalar> Parser::parse_numeric() {
    size_t pos = m_it.consumed();
    auto word = read_word();

    auto t_pos = word.find_first_of("Tt");
    if (t_pos != StringView::npos) {
        DateFields date;
        TimeFields time;
        if (!match_date(word.substr(0, t_pos), date) || !match_time(word.substr(t_pos + 1), time)) {
            set_error(Kind::MALFORMED_LITERAL, pos, word, "malformed date-time");
            return std::nullopt;
        }
        return validate(Kind::INVALID_VALUE, pos, word, [&] () -> Scalar {
            return DateTime{Date{date.year, date.month, date.day},
                            Time{time.hour, time.minute, time.second, time.utc, time.zone_hour, time.zone_minute}};
        });
    }

    if (word.find(':') != StringView::npos) {
        TimeFields time;
        if (!match_time(word, time)) {
            set_error(Kind::MALFORMED_LITERAL, pos, word, "malformed time");
            return std::nullopt;
        }
        return validate(Kind::INVALID_VALUE, pos, word, [&] () -> Scalar {
            return Time{time.hour, time.minute, time.second, time.utc, time.zone_hour, time.zone_minute};
        });
    }

    DateFields date;
    if (match_date(word, date)) {
        return validate(Kind::INVALID_VALUE, pos, word, [&] () -> Scalar { return Date{date.year, date.month, date.day}; });
    }

    OptionalUnits units;
    if (word.find('#') != StringView::npos) {
        int radix;
        StringView digits;
        if (!match_based(word, radix, digits)) {
            set_error(Kind::MALFORMED_LITERAL, pos, word, "malformed based integer");
            return std::nullopt;
        }
        auto based = validate(Kind::MALFORMED_LITERAL, pos, word, [&] () { return BasedInteger{radix, digits}; });
        if (!based || !parse_units(units)) return std::nullopt;
        return BasedInteger{based->radix(), based->digits(), units};
    }

    if (match_real(word)) {
        Float value;
        if (!str_to_float(word, value)) {
            set_error(Kind::INVALID_VALUE, pos, word, "real value out of range");
            return std::nullopt;
        }
        if (!parse_units(units)) return std::nullopt;
        return validate(Kind::INVALID_VALUE, pos, word, [&] () -> Scalar { return Real{value, units}; });
    }

    if (match_integer(word)) {
        auto value = BigInt::from_str(word);
        if (!parse_units(units)) return std::nullopt;
        return Integer{std::move(value), units};
    }

    set_error(Kind::MALFORMED_LITERAL, pos, word, "malformed numeric literal");
    return std::nullopt;
}

inline
std::optional<Scalar> Parser::parse_text() {
    size_t pos = m_it.consumed();
    m_it.next();
    auto content = m_it.take_while([] (char c) { return c != '"'; });
    if (!m_it.match('"')) {
        set_error(Kind::UNEXPECTED_END, pos, "unterminated text");
        return std::nullopt;
    }
    return validate(Kind::INVALID_VALUE, pos, m_it.slice(pos, m_it.consumed()), [content] () -> Scalar { return Text{content}; });
}

inline
std::optional<Scalar> Parser::parse_symbol() {
    size_t pos = m_it.consumed();
    m_it.next();
    auto content = m_it.take_while([] (char c) { return c != '\''; });
    if (!m_it.match('\'')) {
        set_error(Kind::UNEXPECTED_END, pos, "unterminated symbol");
        return std::nullopt;
    }
    return validate(Kind::INVALID_VALUE, pos, m_it.slice(pos, m_it.consumed()), [content] () -> Scalar { return Symbol{content}; });
}

inline
std::optional<Scalar> Parser::parse_identifier_value() {
    auto identifier = parse_identifier();
    if (!identifier) return std::nullopt;
    return Scalar{*identifier};
}

/// Parse `( item, ... )` where every item is a scalar, or every item is a
/// parenthesized sequence of scalars.
inline
std::optional<Value> Parser::parse_sequence() {
    size_t pos = m_it.consumed();
    m_it.next();
    if (!skip_whitespace()) return std::nullopt;

    if (m_it.peek() != '(') {
        m_it.seek(pos);
        auto sequence = parse_sequence_1d();
        if (!sequence) return std::nullopt;
        return Value{std::move(*sequence)};
    }

    Sequence2D sequence;
    while (true) {
        if (!skip_whitespace()) return std::nullopt;
        if (m_it.peek() != '(') {
            set_error(Kind::EXPECTED_TOKEN, m_it.consumed(), "expected '('");
            return std::nullopt;
        }
        auto row = parse_sequence_1d();
        if (!row) return std::nullopt;
        sequence.append(std::move(*row));

        if (!skip_whitespace()) return std::nullopt;
        if (m_it.match(')')) break;
        if (!expect(',', "',' or ')'")) return std::nullopt;
    }
    return Value{std::move(sequence)};
}

inline
std::optional<Sequence1D> Parser::parse_sequence_1d() {
    m_it.next();
    Sequence1D sequence;
    while (true) {
        auto item = parse_scalar();
        if (!item) return std::nullopt;
        sequence.append(std::move(*item));

        if (!skip_whitespace()) return std::nullopt;
        if (m_it.match(')')) break;
        if (!expect(',', "',' or ')'")) return std::nullopt;
    }
    return sequence;
}

inline
std::optional<Value> Parser::parse_set() {
    m_it.next();
    Set set;
    if (!skip_whitespace()) return std::nullopt;
    if (m_it.match('}')) return Value{std::move(set)};

    while (true) {
        if (!skip_whitespace()) return std::nullopt;
        size_t pos = m_it.consumed();
        auto member = parse_scalar();
        if (!member) return std::nullopt;
        auto added = validate(Kind::INVALID_VALUE, pos, m_it.slice(pos, m_it.consumed()),
                              [&] () { return set.add(*member); });
        if (!added) return std::nullopt;

        if (!skip_whitespace()) return std::nullopt;
        if (m_it.match('}')) break;
        if (!expect(',', "',' or '}'")) return std::nullopt;
    }
    return Value{std::move(set)};
}

/// Parse an optional `<units>` suffix.  Whitespace inside the brackets is
/// not significant.
inline
bool Parser::parse_units(OptionalUnits& units) {
    size_t pos = m_it.consumed();
    if (!skip_whitespace()) return false;
    if (!m_it.match('<')) {
        m_it.seek(pos);
        return true;
    }

    size_t begin = m_it.consumed() - 1;
    String expression;
    for (char c = m_it.peek(); !m_it.done() && c != '>'; m_it.next(), c = m_it.peek()) {
        if (!is_space(c)) expression.push_back(c);
    }
    if (!m_it.match('>')) {
        set_error(Kind::UNEXPECTED_END, begin, "unterminated units expression");
        return false;
    }

    auto parsed = validate(Kind::MALFORMED_LITERAL, begin, m_it.slice(begin, m_it.consumed()),
                           [&expression] () { return Units{expression}; });
    if (!parsed) return false;
    units = std::move(*parsed);
    return true;
}

inline
std::optional<Identifier> Parser::parse_identifier() {
    size_t pos = m_it.consumed();
    auto word = read_identifier();
    if (word.empty()) {
        set_error(Kind::EXPECTED_TOKEN, pos, "expected identifier");
        return std::nullopt;
    }
    return validate(Kind::INVALID_VALUE, pos, word, [word] () { return Identifier{word}; });
}

/// Read the text of an identifier.  Blanks may separate the pointer marker
/// and the namespace colon from the names, as in "^ IMAGE" or "NS : NAME",
/// and are dropped from the result.
inline
String Parser::read_identifier() {
    String text;
    if (m_it.match('^')) {
        text.push_back('^');
        m_it.take_while(is_blank);
    }
    text.append(m_it.take_while(is_name_char));

    size_t name_end = m_it.consumed();
    m_it.take_while(is_blank);
    if (!text.empty() && text.back() != '^' && m_it.match(':')) {
        text.push_back(':');
        m_it.take_while(is_blank);
        text.append(m_it.take_while(is_name_char));
    } else {
        m_it.seek(name_end);
    }
    return text;
}

inline
StringView Parser::read_word() {
    return m_it.take_while(is_numeric_char);
}

inline
bool Parser::expect(char c, const char* what) {
    if (m_it.match(c)) return true;
    if (m_it.done()) set_error(Kind::UNEXPECTED_END, m_it.consumed(), fmt::format("expected {}", what));
    else set_error(Kind::EXPECTED_TOKEN, m_it.consumed(), fmt::format("expected {}", what));
    return false;
}

inline
bool Parser::skip_whitespace() {
    if (m_it.consume_whitespace()) return true;
    set_error(Kind::MALFORMED_LITERAL, m_it.consumed(), "unterminated comment");
    return false;
}

inline
void Parser::set_error(Kind kind, size_t offset, const std::string& message) {
    parse::Scanner at{m_it.input()};
    at.seek(offset);
    set_error(kind, offset, at.lexeme(), message);
}

inline
void Parser::set_error(Kind kind, size_t offset, const StringView& lexeme, const std::string& message) {
    m_error.emplace(kind, m_it.input(), offset, lexeme, message);
}

/// Invoke a value constructor, and convert a ValidationError to a ParseError.
template <typename Make>
auto Parser::validate(Kind kind, size_t offset, const StringView& lexeme, Make&& make) -> std::optional<decltype(make())> {
    try {
        return make();
    } catch (const ValidationError& e) {
        set_error(kind, offset, lexeme, e.message());
        return std::nullopt;
    }
}

} // namespace impl


/// Parse a label from the beginning of `input`.
/// @param error Set to the error, if parsing fails.
/// @return Returns the label, or std::nullopt.
inline
std::optional<Label> parse(const Options& options, const StringView& input, std::optional<ParseError>& error) {
    impl::Parser parser{options, input};
    auto label = parser.parse_label();
    if (!label) {
        PDSL_ASSERT(parser.error().has_value());
        error.emplace(*parser.error());
    }
    return label;
}

inline
std::optional<Label> parse(const StringView& input, std::optional<ParseError>& error) {
    return parse({}, input, error);
}

/// Parse a label from the beginning of `input`.
/// @throw ParseError if the input does not begin with a valid label.
inline
Label parse(const Options& options, const StringView& input) {
    std::optional<ParseError> error;
    auto label = parse(options, input, error);
    if (!label) {
        PDSL_ASSERT(error.has_value());
        throw *error;
    }
    return std::move(*label);
}

inline
Label parse(const StringView& input) {
    return parse(Options{}, input);
}

} // namespace pdsl::odl
