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

#include <exception>
#include <string>
#include <string_view>
#include <sstream>

#define PDSL_ASSERT(cond) { if (!(cond)) throw ::pdsl::Assert{#cond}; }

class NoTraceException : public std::exception
{
  public:
    NoTraceException(std::string&& msg) : m_msg{msg} {}
    const char* what() const noexcept override { return m_msg.data(); }
    const char* message() const noexcept { return m_msg.data(); }
  private:
    std::string m_msg;
};

#if __has_include(<cpptrace/cpptrace.hpp>)
#include <cpptrace/cpptrace.hpp>
#define PDSL_HAS_CPPTRACE 1
#define PDSL_BASE_EXCEPTION cpptrace::exception_with_message
#else
#define PDSL_BASE_EXCEPTION NoTraceException
#endif

namespace pdsl {

class PdslException : public PDSL_BASE_EXCEPTION
{
  public:
    PdslException(std::string&& msg) : PDSL_BASE_EXCEPTION(std::forward<std::string>(msg)) {}
    PdslException() : PdslException{""} {}
};

class Assert : public PDSL_BASE_EXCEPTION
{
  public:
    Assert(std::string&& msg) : PDSL_BASE_EXCEPTION(std::forward<std::string>(msg)) {}
};

struct WrongType : public PdslException
{
    static std::string make_message(const std::string_view& actual) {
        std::stringstream ss;
        ss << "type=" << actual;
        return ss.str();
    }

    static std::string make_message(const std::string_view& actual, const std::string_view& expected) {
        std::stringstream ss;
        ss << "type=" << actual << ", expected=" << expected;
        return ss.str();
    }

    WrongType(const std::string_view& actual) : PdslException(make_message(actual)) {}
    WrongType(const std::string_view& actual, const std::string_view& expected) : PdslException(make_message(actual, expected)) {}
};

/////////////////////////////////////////////////////////////////////////////
/// Thrown when a value, identifier, or statement does not satisfy the
/// syntactic constraints of the label grammar, or when a statement kind is
/// not allowed in the container it is inserted into.
/// - Values that exist in memory have always passed validation, so a tree
///   built through the public API is structurally valid by construction.
/////////////////////////////////////////////////////////////////////////////
struct ValidationError : public PdslException
{
    ValidationError(std::string&& msg) : PdslException(std::forward<std::string>(msg)) {}
};

struct IndexError : public ValidationError
{
    static std::string make_message(int64_t index, size_t size) {
        std::stringstream ss;
        ss << "index " << index << " out of range for size " << size;
        return ss.str();
    }

    IndexError(int64_t index, size_t size) : ValidationError(make_message(index, size)) {}
};

struct IdentifierNotFound : public ValidationError
{
    IdentifierNotFound(const std::string_view& identifier)
      : ValidationError("no statement with identifier " + std::string{identifier}) {}
};

/// Thrown when a tree contains a value that has no textual rendering.
struct SerializationError : public PdslException
{
    SerializationError(std::string&& msg) : PdslException(std::forward<std::string>(msg)) {}
};

} // pdsl namespace
