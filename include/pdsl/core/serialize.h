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
#include <ostream>
#include <sstream>

#include "Statement.h"
#include <pdsl/support/string.h>

namespace pdsl {

struct SerializeOptions
{
    String line_ending = "\r\n";
    size_t indent = 1;         // spaces per nesting level
    size_t min_key_width = 0;  // minimum width of the key column
};


namespace impl {

inline
size_t render_key_width(const Statement& statement) {
    switch (statement.type()) {
        case Statement::ATTRIBUTE_IX: return statement.identifier().to_str().size();
        case Statement::GROUP_IX:     return StringView{"END_GROUP"}.size();
        case Statement::OBJECT_IX:    return StringView{"END_OBJECT"}.size();
        default:                      throw WrongType(statement.type_name());
    }
}

/// Write the statements of one block.  The '=' of every line in the block,
/// including the closing lines of nested blocks, is aligned one space past
/// the longest key in the block.
template <class Kinds>
void write_block(std::ostream& os, const Statements<Kinds>& block, size_t depth, const SerializeOptions& options) {
    size_t width = options.min_key_width;
    for (auto& statement : block)
        width = std::max(width, render_key_width(statement));

    String indent(depth * options.indent, ' ');

    auto write_line = [&] (const StringView& key, const String& value) {
        os << indent << pad_right(key, width) << " = " << value << options.line_ending;
    };

    for (auto& statement : block) {
        statement.visit(overloaded {
            [&] (const Attribute& attribute) {
                write_line(attribute.identifier().to_str(), attribute.value().to_str());
            },
            [&] (const Group& group) {
                write_line("GROUP", group.identifier().to_str());
                write_block(os, group.statements(), depth + 1, options);
                write_line("END_GROUP", group.identifier().to_str());
            },
            [&] (const Object& object) {
                write_line("OBJECT", object.identifier().to_str());
                write_block(os, object.statements(), depth + 1, options);
                write_line("END_OBJECT", object.identifier().to_str());
            }
        });
    }
}

} // namespace impl


/// Render a label in the label grammar, terminated by the END statement.
/// @throw SerializationError if the label contains an empty sequence.  No
///        output is produced in that case.
inline
String serialize(const Label& label, const SerializeOptions& options = {}) {
    std::stringstream ss;
    impl::write_block(ss, label, 0, options);
    ss << "END" << options.line_ending;
    return ss.str();
}

inline
void serialize(std::ostream& os, const Label& label, const SerializeOptions& options = {}) {
    os << serialize(label, options);
}

} // namespace pdsl
