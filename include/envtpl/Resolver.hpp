#pragma once

#include "envtpl/Error.hpp"
#include "envtpl/Token.hpp"
#include "envtpl/VariableStore.hpp"

#include <span>
#include <string>
#include <string_view>

namespace envtpl {

struct ResolveOptions {
  bool expand_vars_     = false; // follow "$NAME" values
  bool fail_on_missing_ = true;
};

class Resolver {
  VariableStore const& store_;
  ResolveOptions       options_;

public:
  Resolver(VariableStore const& store, ResolveOptions options) noexcept;

  [[nodiscard]] Result<Resolution>  resolve(std::string_view token) const;
  [[nodiscard]] Result<Resolutions> resolveAll(std::span<std::string const> tokens) const;
};

} // namespace envtpl
