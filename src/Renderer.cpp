#include "envtpl/Renderer.hpp"
#include "envtpl/Log.hpp"
#include "envtpl/Token.hpp"

#include <string>
#include <utility>

namespace envtpl {

Renderer::Renderer(Resolver const& resolver) noexcept
    : resolver_(resolver) {}

Result<std::string> Renderer::render(std::string_view text) const {
  auto tokens = extractTokens(text);
  if (tokens.empty()) {
    return std::string(text);
  }

  log::debug("found {} distinct token(s)", tokens.size());

  auto resolutions = resolver_.resolveAll(tokens);
  if (!resolutions) {
    return std::unexpected(std::move(resolutions.error()));
  }
  return substitute(text, *resolutions);
}

} // namespace envtpl
