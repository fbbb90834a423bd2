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

#include <fmt/format.h>
#include <pdsl/core/Identifier.h>
#include <pdsl/core/Units.h>
#include <pdsl/core/Scalar.h>
#include <pdsl/core/Value.h>

namespace fmt {

template <>
struct formatter<pdsl::Identifier> : formatter<std::string> {
  auto format(const pdsl::Identifier& identifier, format_context& ctx) const {
    return formatter<std::string>::format(identifier.to_str(), ctx);
  }
};

template <>
struct formatter<pdsl::Units> : formatter<std::string> {
  auto format(const pdsl::Units& units, format_context& ctx) const {
    return formatter<std::string>::format(units.to_str(), ctx);
  }
};

template <>
struct formatter<pdsl::Scalar> : formatter<std::string> {
  auto format(const pdsl::Scalar& scalar, format_context& ctx) const {
    return formatter<std::string>::format(scalar.to_str(), ctx);
  }
};

template <>
struct formatter<pdsl::Value> : formatter<std::string> {
  auto format(const pdsl::Value& value, format_context& ctx) const {
    return formatter<std::string>::format(value.to_str(), ctx);
  }
};

} // namespace fmt
