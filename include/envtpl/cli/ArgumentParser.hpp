#pragma once

#include "envtpl/Error.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace envtpl::cli {

// An option name paired with the value it was given.
using Occurrence = std::pair<std::string, std::string>;

struct Option {
  std::string                           name_;
  char                                  short_name_ = '\0';
  std::string                           description_;
  bool                                  takes_value_ = false;
  std::optional<std::string>            default_value_;
  std::function<bool(std::string_view)> check_;

  Option(std::string name, char short_name) noexcept;

  auto desc(std::string desc) noexcept -> Option&;
  auto value() noexcept -> Option&;
  auto default_value(std::string value) -> Option&;
  // Values failing `predicate` are rejected at parse time.
  auto check(std::function<bool(std::string_view)> predicate) -> Option&;
};

class Arguments {
  friend class ArgumentParser;

  std::unordered_map<std::string, std::vector<std::string>> values_;
  std::vector<Occurrence>                                   occurrences_; // value options, command-line order
  std::vector<std::string>                                  positional_;

public:
  [[nodiscard]] bool has(std::string const& name) const noexcept;

  // Last value given, or the default.
  [[nodiscard]] std::optional<std::string> get(std::string const& name) const;

  // How often a value option appeared on the command line. Defaults do not count.
  [[nodiscard]] std::size_t count(std::string_view name) const noexcept;

  [[nodiscard]] std::vector<Occurrence> ordered(std::initializer_list<std::string_view> names) const;

  [[nodiscard]] std::vector<std::string> const& positional() const noexcept {
    return positional_;
  }
};

class ArgumentParser {
  std::string         name_;
  std::string         desc_;
  std::string         positional_name_; // empty: no positional arguments accepted
  std::vector<Option> options_;

public:
  ArgumentParser(std::string name, std::string desc) noexcept;

  auto add_argument(std::string name, char short_name = '\0') -> Option&;
  auto positional(std::string name) noexcept -> ArgumentParser&;

  // Failures are ConfigErrors.
  auto parse(int argc, char const* const* argv) const -> Result<Arguments>;
  auto parse(std::span<std::string const> args) const -> Result<Arguments>;

  [[nodiscard]] auto help() const -> std::string;

private:
  auto find(std::string_view name) const noexcept -> Option const*;
  auto find(char short_name) const noexcept -> Option const*;

  static auto record(Arguments& args, Option const& option, std::string_view spelled, std::string value)
      -> Result<void>;
};

auto create_envtpl_parser() -> ArgumentParser;

void print_version();

} // namespace envtpl::cli
