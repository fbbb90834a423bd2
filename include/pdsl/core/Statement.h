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
#include <optional>
#include <ranges>
#include <initializer_list>
#include <fmt/format.h>

#include "Identifier.h"
#include "Value.h"

#include <pdsl/support/types.h>
#include <pdsl/support/exception.h>

namespace pdsl {

class Statement;

enum StatementKind : uint8_t {
    ATTRIBUTE = 1,
    GROUP     = 2,
    OBJECT    = 4,
};

struct LabelKinds
{
    static constexpr uint8_t allowed = ATTRIBUTE | GROUP | OBJECT;
    static constexpr const char* name = "label";
};

struct GroupKinds
{
    static constexpr uint8_t allowed = ATTRIBUTE;
    static constexpr const char* name = "group";
};

struct ObjectKinds
{
    static constexpr uint8_t allowed = ATTRIBUTE | GROUP | OBJECT;
    static constexpr const char* name = "object";
};

/////////////////////////////////////////////////////////////////////////////
/// An ordered sequence of statements, addressable by index and by identifier.
/// - The kinds of statement the container accepts are given by `Kinds::allowed`,
///   and are checked on every insertion.
/// - Indices may be negative, counting from the end.
/// - Identifier lookup returns the first statement with a matching identifier.
///   Duplicate identifiers may be stored, but cannot be told apart by lookup.
/// - Setting by identifier replaces the first match in place, or appends a
///   new statement if there is none.
/// - The container must not be modified while it is being iterated.
/////////////////////////////////////////////////////////////////////////////
template <class Kinds>
class Statements
{
  public:
    using Items = std::vector<Statement>;
    using iterator = typename Items::iterator;
    using const_iterator = typename Items::const_iterator;
    using reverse_iterator = typename Items::reverse_iterator;
    using const_reverse_iterator = typename Items::const_reverse_iterator;

    Statements() = default;
    Statements(std::initializer_list<Statement> statements);

    static bool is_allowed(const Statement& statement);

    size_t size() const { return m_items.size(); }
    bool empty() const  { return m_items.empty(); }

    const Statement& get(Int index) const { return m_items[resolve_index(index, size())]; }
    Statement& get(Int index)             { return m_items[resolve_index(index, size())]; }

    void set(Int index, const Statement& statement);
    void insert(Int index, const Statement& statement);
    void append(const Statement& statement);
    Statement pop(Int index = -1);

    std::optional<size_t> index_of(const Identifier& identifier) const;
    bool contains(const Identifier& identifier) const { return index_of(identifier).has_value(); }

    const Statement& get(const Identifier& identifier) const { return m_items[require(identifier)]; }
    Statement& get(const Identifier& identifier)             { return m_items[require(identifier)]; }

    const Value& value(const Identifier& identifier) const;

    void set(const Identifier& identifier, const Value& value);
    void set(const Identifier& identifier, const Statements<GroupKinds>& statements);
    void set(const Identifier& identifier, const Statements<ObjectKinds>& statements);

    void del(const Identifier& identifier) { m_items.erase(m_items.begin() + require(identifier)); }

    iterator begin()                      { return m_items.begin(); }
    iterator end()                        { return m_items.end(); }
    const_iterator begin() const          { return m_items.begin(); }
    const_iterator end() const            { return m_items.end(); }
    reverse_iterator rbegin()             { return m_items.rbegin(); }
    reverse_iterator rend()               { return m_items.rend(); }
    const_reverse_iterator rbegin() const { return m_items.rbegin(); }
    const_reverse_iterator rend() const   { return m_items.rend(); }

    auto reversed() const { return std::views::reverse(m_items); }

    bool operator == (const Statements& other) const { return m_items == other.m_items; }

  private:
    void check_allowed(const Statement& statement) const;
    size_t require(const Identifier& identifier) const;
    void replace_or_append(const Identifier& identifier, Statement&& statement);

  private:
    Items m_items;
};

using Label = Statements<LabelKinds>;
using GroupStatements = Statements<GroupKinds>;
using ObjectStatements = Statements<ObjectKinds>;


/// An identifier/value assignment.
class Attribute
{
  public:
    Attribute(const Identifier& identifier, const Value& value) : m_identifier{identifier}, m_value{value} {}

    const Identifier& identifier() const { return m_identifier; }
    const Value& value() const           { return m_value; }
    Value& value()                       { return m_value; }

    bool operator == (const Attribute& other) const = default;

  private:
    Identifier m_identifier;
    Value m_value;
};

/// A named block of attributes.  The identifier must be a plain name.
class Group
{
  public:
    Group(const Identifier& identifier, const GroupStatements& statements = {});

    const Identifier& identifier() const       { return m_identifier; }
    const GroupStatements& statements() const  { return m_statements; }
    GroupStatements& statements()              { return m_statements; }

    bool operator == (const Group& other) const = default;

  private:
    Identifier m_identifier;
    GroupStatements m_statements;
};

/// A named block of attributes, groups, and objects.  The identifier must be
/// a plain name.
class Object
{
  public:
    Object(const Identifier& identifier, const ObjectStatements& statements = {});

    const Identifier& identifier() const       { return m_identifier; }
    const ObjectStatements& statements() const { return m_statements; }
    ObjectStatements& statements()             { return m_statements; }

    bool operator == (const Object& other) const = default;

  private:
    Identifier m_identifier;
    ObjectStatements m_statements;
};


class Statement
{
  public:
    using Repr = std::variant<Attribute, Group, Object>;

    enum ReprIX {
        ATTRIBUTE_IX,
        GROUP_IX,
        OBJECT_IX
    };

    static std::string_view type_name(uint8_t repr_ix) {
        switch (repr_ix) {
            case ATTRIBUTE_IX: return "attribute";
            case GROUP_IX:     return "group";
            case OBJECT_IX:    return "object";
            default:           return "<undefined>";
        }
    }

  public:
    Statement(const Attribute& v) : m_repr{v} {}
    Statement(const Group& v)     : m_repr{v} {}
    Statement(const Object& v)    : m_repr{v} {}
    Statement(Attribute&& v)      : m_repr{std::move(v)} {}
    Statement(Group&& v)          : m_repr{std::move(v)} {}
    Statement(Object&& v)         : m_repr{std::move(v)} {}

    ReprIX type() const                { return (ReprIX)m_repr.index(); }
    std::string_view type_name() const { return type_name(type()); }

    /// The kind as a bit of a container's allowed-kinds mask.
    StatementKind kind() const { return (StatementKind)(1 << m_repr.index()); }

    template <typename T>
    bool is_type() const { return std::holds_alternative<T>(m_repr); }

    template <typename T>
    const T& as() const {
        if (auto p = std::get_if<T>(&m_repr)) return *p;
        throw WrongType(type_name(), type_name(variant_index_v<T, Repr>));
    }

    template <typename T>
    T& as() {
        if (auto p = std::get_if<T>(&m_repr)) return *p;
        throw WrongType(type_name(), type_name(variant_index_v<T, Repr>));
    }

    template <typename V>
    decltype(auto) visit(V&& visitor) const { return std::visit(std::forward<V>(visitor), m_repr); }

    template <typename V>
    decltype(auto) visit(V&& visitor) { return std::visit(std::forward<V>(visitor), m_repr); }

    const Identifier& identifier() const {
        return visit([] (const auto& v) -> const Identifier& { return v.identifier(); });
    }

    bool operator == (const Statement& other) const = default;

  private:
    Repr m_repr;
};


inline
Group::Group(const Identifier& identifier, const GroupStatements& statements)
  : m_identifier{identifier}
  , m_statements{statements}
{
    if (!identifier.is_plain())
        throw ValidationError("group identifier must be a plain name: " + identifier.to_str());
}

inline
Object::Object(const Identifier& identifier, const ObjectStatements& statements)
  : m_identifier{identifier}
  , m_statements{statements}
{
    if (!identifier.is_plain())
        throw ValidationError("object identifier must be a plain name: " + identifier.to_str());
}


template <class Kinds>
Statements<Kinds>::Statements(std::initializer_list<Statement> statements) {
    m_items.reserve(statements.size());
    for (auto& statement : statements)
        append(statement);
}

template <class Kinds>
bool Statements<Kinds>::is_allowed(const Statement& statement) {
    return (Kinds::allowed & statement.kind()) != 0;
}

template <class Kinds>
void Statements<Kinds>::check_allowed(const Statement& statement) const {
    if (!is_allowed(statement))
        throw ValidationError(fmt::format("{} cannot contain {} statement {}",
                                          Kinds::name, statement.type_name(), statement.identifier().to_str()));
}

template <class Kinds>
void Statements<Kinds>::set(Int index, const Statement& statement) {
    auto& target = m_items[resolve_index(index, size())];
    check_allowed(statement);
    target = statement;
}

template <class Kinds>
void Statements<Kinds>::insert(Int index, const Statement& statement) {
    auto pos = resolve_index(index, size(), true);
    check_allowed(statement);
    m_items.insert(m_items.begin() + pos, statement);
}

template <class Kinds>
void Statements<Kinds>::append(const Statement& statement) {
    check_allowed(statement);
    m_items.push_back(statement);
}

template <class Kinds>
Statement Statements<Kinds>::pop(Int index) {
    auto it = m_items.begin() + resolve_index(index, size());
    Statement statement = std::move(*it);
    m_items.erase(it);
    return statement;
}

template <class Kinds>
std::optional<size_t> Statements<Kinds>::index_of(const Identifier& identifier) const {
    for (size_t i = 0; i < m_items.size(); ++i)
        if (m_items[i].identifier() == identifier) return i;
    return std::nullopt;
}

template <class Kinds>
size_t Statements<Kinds>::require(const Identifier& identifier) const {
    auto index = index_of(identifier);
    if (!index) throw IdentifierNotFound(identifier.to_str());
    return *index;
}

template <class Kinds>
const Value& Statements<Kinds>::value(const Identifier& identifier) const {
    return get(identifier).template as<Attribute>().value();
}

template <class Kinds>
void Statements<Kinds>::replace_or_append(const Identifier& identifier, Statement&& statement) {
    check_allowed(statement);
    if (auto index = index_of(identifier)) m_items[*index] = std::move(statement);
    else m_items.push_back(std::move(statement));
}

template <class Kinds>
void Statements<Kinds>::set(const Identifier& identifier, const Value& value) {
    if (auto index = index_of(identifier); index && m_items[*index].template is_type<Attribute>()) {
        m_items[*index].template as<Attribute>().value() = value;
        return;
    }
    replace_or_append(identifier, Attribute{identifier, value});
}

template <class Kinds>
void Statements<Kinds>::set(const Identifier& identifier, const GroupStatements& statements) {
    replace_or_append(identifier, Group{identifier, statements});
}

template <class Kinds>
void Statements<Kinds>::set(const Identifier& identifier, const ObjectStatements& statements) {
    replace_or_append(identifier, Object{identifier, statements});
}

} // namespace pdsl
