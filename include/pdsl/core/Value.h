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
#include <vector>
#include <initializer_list>
#include <ostream>
#include <fmt/format.h>
#include <tsl/ordered_set.h>

#include "Scalar.h"

#include <pdsl/support/types.h>
#include <pdsl/support/exception.h>

namespace pdsl {

/// Resolve a possibly negative index into a container of size `size`.
/// @param allow_end If true, `size` itself is a valid result (insertion point).
/// @throw IndexError if the index is out of range.
inline
size_t resolve_index(Int index, size_t size, bool allow_end = false) {
    Int resolved = (index < 0)? index + (Int)size: index;
    if (resolved < 0 || resolved > (Int)size || (resolved == (Int)size && !allow_end))
        throw IndexError(index, size);
    return (size_t)resolved;
}


/////////////////////////////////////////////////////////////////////////////
/// A collection of unique Integer and Symbol values.
/// - Members iterate and render in insertion order.
/// - Two sets are equal when they have the same members, in any order.
/////////////////////////////////////////////////////////////////////////////
class Set
{
  public:
    using Members = tsl::ordered_set<Scalar>;
    using const_iterator = Members::const_iterator;

    Set() = default;
    Set(std::initializer_list<Scalar> members) { for (auto& member : members) add(member); }

    static bool is_allowed(const Scalar& member) { return member.is_type<Integer>() || member.is_type<Symbol>(); }

    /// @return Returns false, if an equal member is already present.
    /// @throw ValidationError if the value is not an Integer or Symbol.
    bool add(const Scalar& member);

    /// @return Returns true, if the member was present and removed.
    bool discard(const Scalar& member) { return m_members.erase(member) > 0; }

    bool contains(const Scalar& member) const { return m_members.find(member) != m_members.end(); }

    size_t size() const { return m_members.size(); }
    bool empty() const  { return m_members.empty(); }

    const_iterator begin() const { return m_members.begin(); }
    const_iterator end() const   { return m_members.end(); }

    String to_str() const;

    bool operator == (const Set& other) const;

  private:
    Members m_members;
};

inline
bool Set::add(const Scalar& member) {
    if (!is_allowed(member))
        throw ValidationError(fmt::format("set member must be an integer or symbol, not {}", member.type_name()));
    return m_members.insert(member).second;
}

inline
String Set::to_str() const {
    String str = "{";
    bool first = true;
    for (auto& member : m_members) {
        if (!first) str += ", ";
        str += member.to_str();
        first = false;
    }
    return str + "}";
}

inline
bool Set::operator == (const Set& other) const {
    if (size() != other.size()) return false;
    for (auto& member : m_members)
        if (!other.contains(member)) return false;
    return true;
}


/////////////////////////////////////////////////////////////////////////////
/// An ordered, parenthesized sequence of items.
/// - Sequence1D holds scalars, and Sequence2D holds Sequence1D rows.
/// - Indices may be negative, counting from the end.
/// - A sequence may be empty while it is being built, but an empty sequence
///   cannot be rendered.
/////////////////////////////////////////////////////////////////////////////
template <typename Item>
class Sequence
{
  public:
    using Items = std::vector<Item>;
    using iterator = typename Items::iterator;
    using const_iterator = typename Items::const_iterator;

    Sequence() = default;
    Sequence(std::initializer_list<Item> items) : m_items{items} {}
    Sequence(Items&& items) : m_items{std::move(items)} {}

    size_t size() const { return m_items.size(); }
    bool empty() const  { return m_items.empty(); }

    const Item& get(Int index) const { return m_items[resolve_index(index, size())]; }
    Item& get(Int index)             { return m_items[resolve_index(index, size())]; }

    void set(Int index, const Item& item)    { m_items[resolve_index(index, size())] = item; }
    void insert(Int index, const Item& item) { m_items.insert(m_items.begin() + resolve_index(index, size(), true), item); }
    void append(const Item& item)            { m_items.push_back(item); }
    void append(Item&& item)                 { m_items.push_back(std::move(item)); }
    Item pop(Int index = -1);

    const Item& operator [] (Int index) const { return get(index); }
    Item& operator [] (Int index)             { return get(index); }

    iterator begin()             { return m_items.begin(); }
    iterator end()               { return m_items.end(); }
    const_iterator begin() const { return m_items.begin(); }
    const_iterator end() const   { return m_items.end(); }

    /// @throw SerializationError if the sequence, or one of its rows, is empty.
    String to_str() const;

    bool operator == (const Sequence& other) const = default;

  private:
    Items m_items;
};

template <typename Item>
Item Sequence<Item>::pop(Int index) {
    auto it = m_items.begin() + resolve_index(index, size());
    Item item = std::move(*it);
    m_items.erase(it);
    return item;
}

template <typename Item>
String Sequence<Item>::to_str() const {
    if (m_items.empty())
        throw SerializationError("sequence does not contain at least 1 value");
    String str = "(";
    for (size_t i = 0; i < m_items.size(); ++i) {
        if (i > 0) str += ", ";
        str += m_items[i].to_str();
    }
    return str + ")";
}

using Sequence1D = Sequence<Scalar>;
using Sequence2D = Sequence<Sequence1D>;


/////////////////////////////////////////////////////////////////////////////
/// The value of an attribute: a scalar, a set, or a 1-D or 2-D sequence.
/// - The scalar alternatives are held directly, rather than as a nested
///   Scalar, so that a single type switch covers every kind of value.
/////////////////////////////////////////////////////////////////////////////
class Value
{
  public:
    using Repr = std::variant<Integer, BasedInteger, Real, Date, Time, DateTime, Text, Symbol, Identifier,
                              Set, Sequence1D, Sequence2D>;

    enum ReprIX {
        INTEGER,
        BASED_INTEGER,
        REAL,
        DATE,
        TIME,
        DATE_TIME,
        TEXT,
        SYMBOL,
        IDENTIFIER,
        SET,
        SEQUENCE_1D,
        SEQUENCE_2D
    };

    template <typename T>
    static constexpr ReprIX get_repr_ix() {
        static_assert(variant_index_v<T, Repr> < std::variant_size_v<Repr>);
        return (ReprIX)variant_index_v<T, Repr>;
    }

    static std::string_view type_name(uint8_t repr_ix) {
        switch (repr_ix) {
            case SET:         return "set";
            case SEQUENCE_1D: return "sequence-1d";
            case SEQUENCE_2D: return "sequence-2d";
            default:          return Scalar::type_name(repr_ix);
        }
    }

  public:
    Value(const Scalar& scalar) : m_repr{scalar.visit([] (const auto& v) -> Repr { return v; })} {}
    Value(const Integer& v)      : m_repr{v} {}
    Value(const BasedInteger& v) : m_repr{v} {}
    Value(const Real& v)         : m_repr{v} {}
    Value(const Date& v)         : m_repr{v} {}
    Value(const Time& v)         : m_repr{v} {}
    Value(const DateTime& v)     : m_repr{v} {}
    Value(const Text& v)         : m_repr{v} {}
    Value(const Symbol& v)       : m_repr{v} {}
    Value(const Identifier& v)   : m_repr{v} {}
    Value(const Set& v)          : m_repr{v} {}
    Value(const Sequence1D& v)   : m_repr{v} {}
    Value(const Sequence2D& v)   : m_repr{v} {}
    Value(Set&& v)               : m_repr{std::move(v)} {}
    Value(Sequence1D&& v)        : m_repr{std::move(v)} {}
    Value(Sequence2D&& v)        : m_repr{std::move(v)} {}
    Value(is_like_Int auto v)    : m_repr{Integer{v}} {}
    Value(is_like_Float auto v)  : m_repr{Real{(Float)v}} {}

    ReprIX type() const                { return (ReprIX)m_repr.index(); }
    std::string_view type_name() const { return type_name(type()); }

    template <typename T>
    bool is_type() const { return std::holds_alternative<T>(m_repr); }

    bool is_scalar() const  { return type() < SET; }
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

    template <typename V>
    decltype(auto) visit(V&& visitor) { return std::visit(std::forward<V>(visitor), m_repr); }

    const Repr& repr() const { return m_repr; }

    Scalar to_scalar() const;
    Int to_int() const;
    Float to_float() const;

    /// @throw SerializationError if the value contains an empty sequence.
    String to_str() const { return visit([] (const auto& v) { return v.to_str(); }); }

    bool operator == (const Value& other) const = default;

  private:
    Repr m_repr;
};

inline
Scalar Value::to_scalar() const {
    return visit(overloaded {
        [this] (const Set&) -> Scalar        { throw WrongType(type_name(), "scalar"); },
        [this] (const Sequence1D&) -> Scalar { throw WrongType(type_name(), "scalar"); },
        [this] (const Sequence2D&) -> Scalar { throw WrongType(type_name(), "scalar"); },
        [] (const auto& v) -> Scalar         { return v; }
    });
}

inline
Int Value::to_int() const {
    if (!is_numeric()) throw WrongType(type_name(), "numeric");
    return to_scalar().to_int();
}

inline
Float Value::to_float() const {
    if (!is_numeric()) throw WrongType(type_name(), "numeric");
    return to_scalar().to_float();
}

inline
std::ostream& operator<< (std::ostream& ostream, const Value& value) {
    return ostream << value.to_str();
}

} // namespace pdsl
