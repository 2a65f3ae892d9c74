#include "llasm/common/string_utils.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace llasm::common {

namespace {

auto IsHexDigit(char c) -> bool {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
         (c >= 'A' && c <= 'F');
}

auto HexValue(char c) -> unsigned {
  if (c >= '0' && c <= '9') {
    return static_cast<unsigned>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<unsigned>(c - 'a' + 10);
  }
  return static_cast<unsigned>(c - 'A' + 10);
}

constexpr std::string_view kHexDigits = "0123456789ABCDEF";

}  // namespace

auto IsQuoted(std::string_view s) -> bool {
  return s.size() >= 2 && s.front() == '"' && s.back() == '"';
}

auto Unescape(std::string_view s) -> std::string {
  if (s.find('\\') == std::string_view::npos) {
    return std::string(s);
  }

  std::string result;
  result.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c == '\\' && i + 1 < s.size()) {
      if (s[i + 1] == '\\') {
        result += '\\';
        ++i;
        continue;
      }
      if (i + 2 < s.size() && IsHexDigit(s[i + 1]) && IsHexDigit(s[i + 2])) {
        result += static_cast<char>(
            (HexValue(s[i + 1]) << 4) | HexValue(s[i + 2]));
        i += 2;
        continue;
      }
    }
    result += c;
  }
  return result;
}

auto UnquoteIfQuoted(std::string_view s) -> std::string {
  if (!IsQuoted(s)) {
    return std::string(s);
  }
  return Unescape(s.substr(1, s.size() - 2));
}

auto Escape(std::string_view bytes) -> std::string {
  std::string result;
  result.reserve(bytes.size() + (bytes.size() / 4));
  for (char c : bytes) {
    auto b = static_cast<unsigned char>(c);
    if (b >= 0x20 && b <= 0x7E && c != '"' && c != '\\') {
      result += c;
      continue;
    }
    result += '\\';
    result += kHexDigits[b >> 4];
    result += kHexDigits[b & 0xF];
  }
  return result;
}

auto Quote(std::string_view bytes) -> std::string {
  std::string result = "\"";
  result += Escape(bytes);
  result += '"';
  return result;
}

}  // namespace llasm::common
