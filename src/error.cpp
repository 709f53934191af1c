/*
 * zlang Error Formatting
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <zlang/error.hpp>

namespace zlang {

std::string to_string(const Error& err) {
    const char* kind = err.kind == ErrorKind::Lex ? "LexError" : "SyntaxError";
    return std::string(kind) + ": " + err.message + " (at offset " + std::to_string(err.pos) + ")";
}

} // namespace zlang
