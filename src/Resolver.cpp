#include "envtpl/Resolver.hpp"
#include "envtpl/Constants.hpp"
#include "envtpl/Log.hpp"
#include "envtpl/Util.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace envtpl {

namespace {

constexpr char INDIRECTION_MARKER = '$';

std::string describeChain(std::vector<std::string> const& chain, std::string const& last) {
  return fmt::format("{} -> {}", fmt::join(chain, " -> "), last);
}

} // namespace

Resolver::Resolver(VariableStore const& store, ResolveOptions options) noexcept
    : store_(store), options_(options) {}

Result<Resolution> Resolver::resolve(std::string_view token) const {
  std::string              name = toUpper(token);
  std::vector<std::string> chain;

  while (true) {
    auto value = store_.lookup(name);
    if (!value) {
      if (!options_.fail_on_missing_) {
        log::debug("leaving ${{{}}} unresolved", token);
        return Resolution{};
      }
      if (chain.empty()) {
        return missingVariableError(token);
      }
      return std::unexpected(Error{
          Error::Kind::MissingVariable, fmt::format("variable not set: {} (via {})", name, fmt::join(chain, " -> "))
      });
    }

    chain.push_back(name);

    // A lone marker names nothing and stays literal.
    if (!options_.expand_vars_ || value->size() < 2 || value->front() != INDIRECTION_MARKER) {
      return Resolution{std::string(*value)};
    }

    auto next = toUpper(value->substr(1));
    if (std::ranges::find(chain, next) != chain.end()) {
      return cyclicReferenceError(fmt::format("cyclic reference: {}", describeChain(chain, next)));
    }
    if (chain.size() >= MAX_INDIRECTION_DEPTH) {
      return cyclicReferenceError(fmt::format(
          "indirection deeper than {} levels: {}", MAX_INDIRECTION_DEPTH, describeChain(chain, next)
      ));
    }
    name = std::move(next);
  }
}

Result<Resolutions> Resolver::resolveAll(std::span<std::string const> tokens) const {
  Resolutions resolutions;
  resolutions.reserve(tokens.size());
  for (auto const& token : tokens) {
    auto resolution = resolve(token);
    if (!resolution) {
      return std::unexpected(std::move(resolution.error()));
    }
    resolutions.emplace(token, std::move(*resolution));
  }
  return resolutions;
}

} // namespace envtpl
