#include "envtpl/VariableStore.hpp"
#include "envtpl/Log.hpp"
#include "envtpl/Util.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace envtpl {

VariableSource VariableSource::assignment(std::string text) {
  return {Kind::Assignment, std::move(text)};
}

VariableSource VariableSource::file(std::string path) {
  return {Kind::File, std::move(path)};
}

void VariableStore::set(std::string name, std::string value) {
  vars_.insert_or_assign(std::move(name), std::move(value));
}

Result<void> VariableStore::setFromFile(std::filesystem::path const& path, bool must_exist) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (must_exist) {
      return configError(fmt::format("variable file not found: {}", path.string()));
    }
    log::debug("skipping absent variable file {}", path.string());
    return {};
  }
  if (std::filesystem::is_directory(path, ec)) {
    return configError(fmt::format("variable file is a directory: {}", path.string()));
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return ioError(fmt::format("cannot read variable file: {}", path.string()));
  }

  std::string line;
  size_t      lineno = 0;
  size_t      loaded = 0;
  while (std::getline(in, line)) {
    ++lineno;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    auto stripped = trim(line);
    if (stripped.empty() || stripped.front() == '#') {
      continue;
    }

    auto eq = line.find('=');
    if (eq == std::string::npos) {
      return configError(fmt::format("{}:{}: expected NAME=VALUE", path.string(), lineno));
    }
    auto name = trim(std::string_view(line).substr(0, eq));
    if (name.empty()) {
      return configError(fmt::format("{}:{}: empty variable name", path.string(), lineno));
    }
    set(std::move(name), line.substr(eq + 1));
    ++loaded;
  }
  if (in.bad()) {
    return ioError(fmt::format("error while reading variable file: {}", path.string()));
  }

  log::debug("loaded {} variable(s) from {}", loaded, path.string());
  return {};
}

void VariableStore::setFromEnvironment(char const* const* envp) {
  if (envp == nullptr) {
    return;
  }
  for (char const* const* env = envp; *env != nullptr; ++env) {
    std::string_view entry{*env};
    if (auto pos = entry.find('='); pos != std::string_view::npos && pos > 0) {
      set(std::string(entry.substr(0, pos)), std::string(entry.substr(pos + 1)));
    }
  }
}

Result<void> VariableStore::assign(std::string_view assignment) {
  auto eq = assignment.find('=');
  if (eq == std::string_view::npos) {
    return configError(fmt::format("invalid assignment '{}', expected NAME=VALUE", assignment));
  }
  auto name = toUpper(trim(assignment.substr(0, eq)));
  if (name.empty()) {
    return configError(fmt::format("invalid assignment '{}', empty name", assignment));
  }
  set(std::move(name), std::string(assignment.substr(eq + 1)));
  return {};
}

Result<void> VariableStore::apply(std::span<VariableSource const> sources) {
  for (auto const& source : sources) {
    Result<void> result;
    switch (source.kind_) {
    case VariableSource::Kind::Assignment:
      result = assign(source.value_);
      break;
    case VariableSource::Kind::File:
      result = setFromFile(source.value_, true);
      break;
    }
    if (!result) {
      return result;
    }
  }
  return {};
}

std::optional<std::string_view> VariableStore::lookup(std::string const& name) const {
  if (auto it = vars_.find(name); it != vars_.end()) {
    return it->second;
  }
  return std::nullopt;
}

bool VariableStore::contains(std::string const& name) const {
  return vars_.contains(name);
}

std::size_t VariableStore::size() const noexcept {
  return vars_.size();
}

} // namespace envtpl
