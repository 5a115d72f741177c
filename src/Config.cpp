#include "envtpl/Config.hpp"

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace envtpl {

namespace {

constexpr std::array SINGLE_VALUE_OPTIONS = {"text", "input", "directory", "output", "extension"};

} // namespace

Result<Config> makeConfig(cli::Arguments const& args) {
  Config config;

  for (auto const* name : SINGLE_VALUE_OPTIONS) {
    if (args.count(name) > 1) {
      return configError(fmt::format("option --{} given more than once", name));
    }
  }

  auto const& positional = args.positional();
  if (positional.size() > 1) {
    return configError(fmt::format("unexpected argument: {}", positional[1]));
  }

  std::vector<std::pair<SourceKind, std::string>> sources;
  if (auto text = args.get("text")) {
    sources.emplace_back(SourceKind::Text, std::move(*text));
  }
  if (auto input = args.get("input")) {
    sources.emplace_back(SourceKind::File, std::move(*input));
  }
  if (!positional.empty()) {
    sources.emplace_back(SourceKind::File, positional.front());
  }
  if (auto directory = args.get("directory")) {
    sources.emplace_back(SourceKind::Directory, std::move(*directory));
  }
  if (sources.size() > 1) {
    return configError("only one of --text, --input (or FILE) and --directory may be given");
  }
  if (!sources.empty()) {
    config.source_kind_ = sources.front().first;
    config.source_      = std::move(sources.front().second);
  }

  if (auto output = args.get("output")) {
    if (output->empty()) {
      return configError("--output must not be empty");
    }
    config.output_ = std::filesystem::path(*output);
  }

  if (auto extension = args.get("extension")) {
    std::string_view ext = *extension;
    if (ext.starts_with('.')) {
      ext.remove_prefix(1);
    }
    if (ext.empty()) {
      return configError("--extension must not be empty");
    }
    config.extension_ = std::string(ext);
  }

  config.fail_on_missing_ = !args.has("silent");
  config.expand_vars_     = args.has("expand-vars");
  config.recursive_       = args.has("recursive");
  config.dry_run_         = args.has("dry-run");
  config.use_environ_     = !args.has("no-environ");

  for (auto const& [option, value] : args.ordered({"env", "env-file"})) {
    config.variable_sources_.push_back(
        option == "env" ? VariableSource::assignment(value) : VariableSource::file(value)
    );
  }

  if (args.has("verbose") && args.has("quiet")) {
    return configError("--verbose and --quiet are mutually exclusive");
  }
  if (args.has("verbose")) {
    config.log_level_ = log::Level::Verbose;
  } else if (args.has("quiet")) {
    config.log_level_ = log::Level::Quiet;
  }

  return config;
}

} // namespace envtpl
