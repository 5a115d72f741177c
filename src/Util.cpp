#include "envtpl/Util.hpp"

#include <algorithm>
#include <ranges>
#include <string>
#include <string_view>

namespace envtpl {

bool isSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool isBlank(char c) noexcept {
  return c == ' ' || c == '\t';
}

bool isAlpha(char c) noexcept {
  return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z');
}

bool isTokenNameChar(char c) noexcept {
  return isAlpha(c) || ('0' <= c && c <= '9') || c == '_' || c == '.' || c == '-';
}

std::string trim(std::string_view sv) {
  auto first = std::ranges::find_if_not(sv, isSpace);
  auto last  = std::ranges::find_if_not(sv | std::views::reverse, isSpace).base();
  if (first >= last) {
    return {};
  }
  return {first, last};
}

std::string toUpper(std::string_view s) {
  std::string out(s);
  std::ranges::transform(out, out.begin(), [](char c) { return ('a' <= c && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c; });
  return out;
}

} // namespace envtpl
