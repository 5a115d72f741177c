#include "envtpl/App.hpp"
#include "envtpl/Constants.hpp"
#include "envtpl/Log.hpp"
#include "envtpl/Renderer.hpp"
#include "envtpl/Resolver.hpp"
#include "envtpl/SourceWalker.hpp"
#include "envtpl/cli/ArgumentParser.hpp"

#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace envtpl {

App::App(std::istream& in, std::ostream& out, char const* const* envp) noexcept
    : in_(in), out_(out), envp_(envp) {}

auto App::run(int argc, char const* const* argv) -> int {
  auto const parser = cli::create_envtpl_parser();
  auto       args   = parser.parse(argc, argv);
  if (!args) {
    return report(args.error());
  }

  if (args->has("help")) {
    fmt::print("{}", parser.help());
    return 0;
  }
  if (args->has("version")) {
    cli::print_version();
    return 0;
  }

  auto config = makeConfig(*args);
  if (!config) {
    return report(config.error());
  }
  log::set_level(config->log_level_);

  std::unique_ptr<Sink> sink;
  if (config->dry_run_) {
    sink = std::make_unique<DryRunSink>();
  } else {
    sink = std::make_unique<OutputSink>(out_);
  }

  if (auto result = execute(*config, *sink); !result) {
    return report(result.error());
  }
  return 0;
}

auto App::buildStore(Config const& config) const -> Result<VariableStore> {
  VariableStore store;
  if (config.use_environ_) {
    store.setFromEnvironment(envp_);
    log::debug("seeded {} variable(s) from the environment", store.size());
  }
  if (auto result = store.apply(config.variable_sources_); !result) {
    return std::unexpected(std::move(result.error()));
  }
  return store;
}

auto App::execute(Config const& config, Sink& sink) -> Result<void> {
  auto store = buildStore(config);
  if (!store) {
    return std::unexpected(std::move(store.error()));
  }

  auto units = SourceWalker(config, in_).collect();
  if (!units) {
    return std::unexpected(std::move(units.error()));
  }

  Resolver const resolver(*store, {.expand_vars_ = config.expand_vars_, .fail_on_missing_ = config.fail_on_missing_});
  Renderer const renderer(resolver);

  for (auto const& unit : *units) {
    log::debug("rendering {}", unit.label_);

    auto rendered = renderer.render(unit.text_);
    if (!rendered) {
      auto error = std::move(rendered.error());
      error.message_ += fmt::format(" in {}", unit.label_);
      return std::unexpected(std::move(error));
    }
    if (auto result = sink.write(unit, *rendered); !result) {
      return result;
    }
  }

  log::debug("rendered {} unit(s)", units->size());
  return {};
}

auto App::report(Error const& error) -> int {
  log::error("{}: {}", error.kind_name(), error.message());
  fmt::print(stderr, "Try '{} --help' for more information.\n", EXE_NAME);
  return error.exit_code();
}

} // namespace envtpl
