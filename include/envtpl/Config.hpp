#pragma once

#include "envtpl/Constants.hpp"
#include "envtpl/Error.hpp"
#include "envtpl/Log.hpp"
#include "envtpl/VariableStore.hpp"
#include "envtpl/cli/ArgumentParser.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace envtpl {

enum class SourceKind {
  Stdin,
  Text,
  File,
  Directory,
};

struct Config {
  SourceKind                           source_kind_ = SourceKind::Stdin;
  std::string                          source_; // text, file path or directory root
  std::optional<std::filesystem::path> output_;

  bool        fail_on_missing_ = true;
  bool        expand_vars_     = false;
  bool        recursive_       = false;
  bool        dry_run_         = false;
  bool        use_environ_     = true;
  std::string extension_{DEFAULT_EXTENSION};

  std::vector<VariableSource> variable_sources_;
  log::Level                  log_level_ = log::Level::Normal;
};

// Turns a successful parse into a Config; contradictory options are a ConfigError.
Result<Config> makeConfig(cli::Arguments const& args);

} // namespace envtpl
