#include "envtpl/Token.hpp"
#include "envtpl/Util.hpp"

#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace envtpl {

std::optional<TokenMatch> matchToken(std::string_view text, std::size_t pos) {
  if (pos + 1 >= text.size() || text[pos] != '$' || text[pos + 1] != '{') {
    return std::nullopt;
  }

  std::size_t i = pos + 2;
  while (i < text.size() && isBlank(text[i])) {
    ++i;
  }

  std::size_t name_begin = i;
  while (i < text.size() && isTokenNameChar(text[i])) {
    ++i;
  }
  if (i == name_begin) {
    return std::nullopt;
  }
  std::size_t name_end = i;

  while (i < text.size() && isBlank(text[i])) {
    ++i;
  }
  if (i >= text.size() || text[i] != '}') {
    return std::nullopt;
  }

  return TokenMatch{pos, i + 1, std::string(text.substr(name_begin, name_end - name_begin))};
}

std::vector<TokenMatch> scanTokens(std::string_view text) {
  std::vector<TokenMatch> matches;

  std::size_t pos = text.find("${");
  while (pos != std::string_view::npos) {
    if (auto match = matchToken(text, pos)) {
      pos = match->end_;
      matches.push_back(std::move(*match));
    } else {
      ++pos;
    }
    pos = text.find("${", pos);
  }
  return matches;
}

std::vector<std::string> extractTokens(std::string_view text) {
  std::vector<std::string>        names;
  std::unordered_set<std::string> seen;
  for (auto& match : scanTokens(text)) {
    if (seen.insert(match.name_).second) {
      names.push_back(std::move(match.name_));
    }
  }
  return names;
}

std::string substitute(std::string_view text, Resolutions const& resolutions) {
  std::string out;
  out.reserve(text.size());

  std::size_t last = 0;
  for (auto const& match : scanTokens(text)) {
    out.append(text.substr(last, match.begin_ - last));

    auto it = resolutions.find(match.name_);
    if (it != resolutions.end() && it->second) {
      out.append(*it->second);
    } else {
      out.append(text.substr(match.begin_, match.length()));
    }
    last = match.end_;
  }
  out.append(text.substr(last));
  return out;
}

} // namespace envtpl
