/*
 * zlang Error Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Declares the error value shared by the lexer and the parser and the
 *   Result/Status wrappers returned by every fallible operation. A scan or a
 *   parse stops at the first defect and hands back exactly one Error.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace zlang {

enum class ErrorKind {
    Lex,
    Syntax
};

struct Error {
    ErrorKind kind;
    std::string message;
    std::size_t pos = 0; // byte offset in the source
};

inline Error lex_error(std::string message, std::size_t pos) { return {ErrorKind::Lex, std::move(message), pos}; }
inline Error syntax_error(std::string message, std::size_t pos) { return {ErrorKind::Syntax, std::move(message), pos}; }

// "LexError: <message> (at offset N)"
std::string to_string(const Error& err);

template <typename T>
class Result {
public:
    Result(T value) : m_data(std::move(value)) {}
    Result(Error err) : m_data(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(m_data); }
    explicit operator bool() const { return ok(); }

    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }
    T take() { return std::move(std::get<T>(m_data)); }

    const Error& error() const { return std::get<Error>(m_data); }
    Error take_error() { return std::move(std::get<Error>(m_data)); }

private:
    std::variant<T, Error> m_data;
};

using Status = Result<std::monostate>;

inline Status ok_status() { return Status(std::monostate{}); }

} // namespace zlang
