#pragma once

#include <string>
#include <string_view>

namespace llasm::common {

// True if `s` is at least two characters long and both starts and ends with
// a double quote.
[[nodiscard]] auto IsQuoted(std::string_view s) -> bool;

// One canonical unescape pass over the body of a quoted IR spelling:
//   "\\"  -> '\'
//   "\XX" -> byte 0xXX (two hex digits, either case)
// Any other backslash is kept as-is. The result holds raw bytes and need not
// be valid UTF-8.
[[nodiscard]] auto Unescape(std::string_view s) -> std::string;

// Strips the surrounding quotes and unescapes if `s` is quoted; returns `s`
// unchanged otherwise.
[[nodiscard]] auto UnquoteIfQuoted(std::string_view s) -> std::string;

// Inverse of Unescape: printable ASCII other than '"' and '\' is copied,
// every other byte is written as "\XX" with uppercase hex digits.
[[nodiscard]] auto Escape(std::string_view bytes) -> std::string;

// Escape(bytes) wrapped in double quotes.
[[nodiscard]] auto Quote(std::string_view bytes) -> std::string;

}  // namespace llasm::common
