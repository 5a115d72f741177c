#pragma once

#include "envtpl/Config.hpp"
#include "envtpl/Error.hpp"
#include "envtpl/Sink.hpp"
#include "envtpl/VariableStore.hpp"

#include <iosfwd>

namespace envtpl {

class App {
  std::istream&            in_;
  std::ostream&            out_;
  char const* const* const envp_;

public:
  App(std::istream& in, std::ostream& out, char const* const* envp) noexcept;

  auto run(int argc, char const* const* argv) -> int;

  // Builds the store, walks the sources and renders each unit into `sink`.
  auto execute(Config const& config, Sink& sink) -> Result<void>;

  auto buildStore(Config const& config) const -> Result<VariableStore>;

private:
  static auto report(Error const& error) -> int;
};

} // namespace envtpl
