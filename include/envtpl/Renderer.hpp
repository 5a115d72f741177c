#pragma once

#include "envtpl/Error.hpp"
#include "envtpl/Resolver.hpp"

#include <string>
#include <string_view>

namespace envtpl {

// extract -> resolve -> substitute for a single text blob.
class Renderer {
  Resolver const& resolver_;

public:
  explicit Renderer(Resolver const& resolver) noexcept;

  [[nodiscard]] Result<std::string> render(std::string_view text) const;
};

} // namespace envtpl
