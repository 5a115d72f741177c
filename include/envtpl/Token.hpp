#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace envtpl {

// A `${ NAME }` occurrence inside a text blob.
struct TokenMatch {
  std::size_t begin_ = 0; // offset of '$'
  std::size_t end_   = 0; // one past '}'
  std::string name_;      // interior whitespace stripped

  [[nodiscard]] std::size_t length() const noexcept {
    return end_ - begin_;
  }
};

// std::nullopt leaves the placeholder untouched.
using Resolution  = std::optional<std::string>;
using Resolutions = std::unordered_map<std::string, Resolution>;

// Matches a placeholder starting exactly at `pos`.
std::optional<TokenMatch> matchToken(std::string_view text, std::size_t pos);

// Every placeholder in `text`, left to right, without overlaps.
std::vector<TokenMatch> scanTokens(std::string_view text);

// Distinct names in order of first appearance.
std::vector<std::string> extractTokens(std::string_view text);

// Replaces each placeholder with its resolution. Names without an entry and
// names mapped to std::nullopt are kept verbatim. Values are inserted as-is.
std::string substitute(std::string_view text, Resolutions const& resolutions);

} // namespace envtpl
