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

#include <cstdint>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <variant>

namespace pdsl {

using Int = int64_t;
using UInt = uint64_t;
using Float = double;
using String = std::string;
using StringView = std::string_view;
using StringStream = std::stringstream;

// std::visit support
template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template<typename T>
concept is_like_Int = std::is_signed<T>::value && std::is_integral<T>::value && std::is_convertible_v<T, Int>;

template<typename T>
concept is_like_Float = std::is_floating_point<T>::value;

// index of alternative T in a std::variant, or the number of alternatives if absent
template <typename T, typename V> struct variant_index;

template <typename T, typename... Ts>
struct variant_index<T, std::variant<Ts...>>
{
    static constexpr size_t find() {
        size_t i = 0;
        bool found = ((std::is_same_v<T, Ts>? true: (++i, false)) || ...);
        return found? i: sizeof...(Ts);
    }
    static constexpr size_t value = find();
};

template <typename T, typename V>
constexpr size_t variant_index_v = variant_index<T, V>::value;

} // namespace pdsl
