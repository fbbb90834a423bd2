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

#include <variant>
#include <functional>
#include <ostream>

#include "Identifier.h"
#include "Numeric.h"
#include "Temporal.h"
#include "Text.h"

#include <pdsl/support/types.h>
#include <pdsl/support/exception.h>

namespace pdsl {

/////////////////////////////////////////////////////////////////////////////
/// A single, non-composite value.
/// - Exactly one of the scalar kinds is held at a time.
/// - Every alternative is validated on construction, so a Scalar that exists
///   is always renderable.
/////////////////////////////////////////////////////////////////////////////
class Scalar
{
  public:
    using Repr = std::variant<Integer, BasedInteger, Real, Date, Time, DateTime, Text, Symbol, Identifier>;

    enum ReprIX {
        INTEGER,
        BASED_INTEGER,
        REAL,
        DATE,
        TIME,
        DATE_TIME,
        TEXT,
        SYMBOL,
        IDENTIFIER
    };

    template <typename T>
    static constexpr ReprIX get_repr_ix() {
        static_assert(variant_index_v<T, Repr> < std::variant_size_v<Repr>);
        return (ReprIX)variant_index_v<T, Repr>;
    }

    static std::string_view type_name(uint8_t repr_ix) {
        switch (repr_ix) {
            case INTEGER:       return "integer";
            case BASED_INTEGER: return "based-integer";
            case REAL:          return "real";
            case DATE:          return "date";
            case TIME:          return "time";
            case DATE_TIME:     return "date-time";
            case TEXT:          return "text";
            case SYMBOL:        return "symbol";
            case IDENTIFIER:    return "identifier";
            default:            return "<undefined>";
        }
    }

  public:
    Scalar(const Integer& v)      : m_repr{v} {}
    Scalar(const BasedInteger& v) : m_repr{v} {}
    Scalar(const Real& v)         : m_repr{v} {}
    Scalar(const Date& v)         : m_repr{v} {}
    Scalar(const Time& v)         : m_repr{v} {}
    Scalar(const DateTime& v)     : m_repr{v} {}
    Scalar(const Text& v)         : m_repr{v} {}
    Scalar(const Symbol& v)       : m_repr{v} {}
    Scalar(const Identifier& v)   : m_repr{v} {}
    Scalar(Integer&& v)           : m_repr{std::move(v)} {}
    Scalar(is_like_Int auto v)    : m_repr{Integer{v}} {}
    Scalar(is_like_Float auto v)  : m_repr{Real{(Float)v}} {}

    ReprIX type() const                { return (ReprIX)m_repr.index(); }
    std::string_view type_name() const { return type_name(type()); }

    template <typename T>
    bool is_type() const { return std::holds_alternative<T>(m_repr); }

    bool is_numeric() const { return is_type<Integer>() || is_type<BasedInteger>() || is_type<Real>(); }

    template <typename T>
    const T& as() const {
        if (auto p = std::get_if<T>(&m_repr)) return *p;
        throw WrongType(type_name(), type_name(get_repr_ix<T>()));
    }

    template <typename T>
    T& as() {
        if (auto p = std::get_if<T>(&m_repr)) return *p;
        throw WrongType(type_name(), type_name(get_repr_ix<T>()));
    }

    template <typename V>
    decltype(auto) visit(V&& visitor) const { return std::visit(std::forward<V>(visitor), m_repr); }

    const Repr& repr() const { return m_repr; }

    Int to_int() const;
    Float to_float() const;
    String to_str() const { return visit([] (const auto& v) { return v.to_str(); }); }

    bool operator == (const Scalar& other) const = default;

    size_t hash() const;

  private:
    Repr m_repr;
};

inline
Int Scalar::to_int() const {
    switch (type()) {
        case INTEGER:       return std::get<Integer>(m_repr).to_int();
        case BASED_INTEGER: return std::get<BasedInteger>(m_repr).to_int();
        case REAL:          return std::get<Real>(m_repr).to_int();
        default:            throw WrongType(type_name(), "numeric");
    }
}

inline
Float Scalar::to_float() const {
    switch (type()) {
        case INTEGER:       return std::get<Integer>(m_repr).to_float();
        case BASED_INTEGER: return std::get<BasedInteger>(m_repr).to_float();
        case REAL:          return std::get<Real>(m_repr).to_float();
        default:            throw WrongType(type_name(), "numeric");
    }
}

inline
size_t Scalar::hash() const {
    return visit(overloaded {
        [] (const Integer& v)      { return v.hash(); },
        [] (const BasedInteger& v) { return v.value().hash() ^ std::hash<int>{}(v.radix()); },
        [] (const Real& v)         { return std::hash<Float>{}(v.value()); },
        [] (const Symbol& v)       { return v.hash(); },
        [] (const Identifier& v)   { return v.hash(); },
        [this] (const auto&)       { return std::hash<String>{}(to_str()); }
    });
}

inline
std::ostream& operator<< (std::ostream& ostream, const Scalar& scalar) {
    return ostream << scalar.to_str();
}

} // namespace pdsl


namespace std {

template<>
struct hash<pdsl::Scalar>
{
    std::size_t operator () (const pdsl::Scalar& scalar) const noexcept {
      return scalar.hash();
    }
};

} // namespace std
