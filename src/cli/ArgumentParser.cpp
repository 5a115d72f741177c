#include "envtpl/cli/ArgumentParser.hpp"
#include "envtpl/Constants.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <fmt/format.h>

namespace envtpl::cli {

Option::Option(std::string name, char short_name) noexcept
    : name_{std::move(name)}, short_name_{short_name} {}

auto Option::desc(std::string desc) noexcept -> Option& {
  description_ = std::move(desc);
  return *this;
}

auto Option::value() noexcept -> Option& {
  takes_value_ = true;
  return *this;
}

auto Option::default_value(std::string value) -> Option& {
  default_value_ = std::move(value);
  return *this;
}

auto Option::check(std::function<bool(std::string_view)> predicate) -> Option& {
  check_ = std::move(predicate);
  return *this;
}

bool Arguments::has(std::string const& name) const noexcept {
  return values_.contains(name);
}

std::optional<std::string> Arguments::get(std::string const& name) const {
  if (auto it = values_.find(name); it != values_.end() && !it->second.empty()) {
    return it->second.back();
  }
  return std::nullopt;
}

std::size_t Arguments::count(std::string_view name) const noexcept {
  return static_cast<std::size_t>(
      std::ranges::count_if(occurrences_, [name](Occurrence const& occurrence) { return occurrence.first == name; })
  );
}

std::vector<Occurrence> Arguments::ordered(std::initializer_list<std::string_view> names) const {
  std::vector<Occurrence> result;
  for (auto const& occurrence : occurrences_) {
    if (std::ranges::any_of(names, [&](std::string_view name) { return name == occurrence.first; })) {
      result.push_back(occurrence);
    }
  }
  return result;
}

ArgumentParser::ArgumentParser(std::string name, std::string desc) noexcept
    : name_{std::move(name)}, desc_{std::move(desc)} {}

auto ArgumentParser::add_argument(std::string name, char short_name) -> Option& {
  return options_.emplace_back(std::move(name), short_name);
}

auto ArgumentParser::positional(std::string name) noexcept -> ArgumentParser& {
  positional_name_ = std::move(name);
  return *this;
}

auto ArgumentParser::parse(int argc, char const* const* argv) const -> Result<Arguments> {
  std::vector<std::string> args(argv + std::min(argc, 1), argv + argc);
  return parse(std::span<std::string const>(args));
}

auto ArgumentParser::parse(std::span<std::string const> args) const -> Result<Arguments> {
  Arguments result;
  bool      options_done = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view arg{args[i]};

    if (!options_done && arg == "--") {
      options_done = true;
      continue;
    }

    // "-" names standard input, it is not an option
    if (options_done || arg == "-" || !arg.starts_with('-')) {
      if (positional_name_.empty()) {
        return configError(fmt::format("unexpected argument: {}", arg));
      }
      result.positional_.emplace_back(arg);
      continue;
    }

    if (arg.starts_with("--")) {
      // Long option, the value either follows '=' or is the next argument
      std::string_view           name = arg.substr(2);
      std::optional<std::string> inline_value;
      if (auto eq_pos = name.find('='); eq_pos != std::string_view::npos) {
        inline_value = std::string(name.substr(eq_pos + 1));
        name         = name.substr(0, eq_pos);
      }

      Option const* option = find(name);
      if (option == nullptr) {
        return configError(fmt::format("unknown option: --{}", name));
      }

      if (!option->takes_value_) {
        if (inline_value) {
          return configError(fmt::format("option --{} does not take a value", name));
        }
        result.values_[option->name_].emplace_back("true");
        continue;
      }

      if (!inline_value) {
        if (i + 1 >= args.size()) {
          return configError(fmt::format("option --{} requires a value", name));
        }
        inline_value = args[++i];
      }
      if (auto recorded = record(result, *option, arg.substr(0, name.size() + 2), std::move(*inline_value));
          !recorded) {
        return std::unexpected(std::move(recorded.error()));
      }
      continue;
    }

    // Short option cluster such as -rE; a value option takes the rest of the cluster or the next argument
    for (std::size_t j = 1; j < arg.size(); ++j) {
      Option const* option = find(arg[j]);
      if (option == nullptr) {
        return configError(fmt::format("unknown option: -{}", arg[j]));
      }

      if (!option->takes_value_) {
        result.values_[option->name_].emplace_back("true");
        continue;
      }

      std::string value;
      if (j + 1 < arg.size()) {
        value = std::string(arg.substr(j + 1));
      } else if (i + 1 < args.size()) {
        value = args[++i];
      } else {
        return configError(fmt::format("option -{} requires a value", arg[j]));
      }
      if (auto recorded = record(result, *option, fmt::format("-{}", arg[j]), std::move(value)); !recorded) {
        return std::unexpected(std::move(recorded.error()));
      }
      break;
    }
  }

  for (auto const& option : options_) {
    if (option.default_value_ && !result.has(option.name_)) {
      result.values_[option.name_].push_back(*option.default_value_);
    }
  }

  return result;
}

auto ArgumentParser::help() const -> std::string {
  std::string out;
  auto        it = std::back_inserter(out);

  fmt::format_to(it, "Usage: {} [OPTIONS]", name_);
  if (!positional_name_.empty()) {
    fmt::format_to(it, " [{}]", positional_name_);
  }
  fmt::format_to(it, "\n\n");

  if (!desc_.empty()) {
    fmt::format_to(it, "{}\n\n", desc_);
  }

  fmt::format_to(it, "Options:\n");
  for (auto const& option : options_) {
    if (option.short_name_ != '\0') {
      fmt::format_to(it, "  -{}, --{}", option.short_name_, option.name_);
    } else {
      fmt::format_to(it, "      --{}", option.name_);
    }
    if (option.takes_value_) {
      fmt::format_to(it, " <value>");
    }
    fmt::format_to(it, "\n      {}", option.description_);
    if (option.default_value_) {
      fmt::format_to(it, " (default: {})", *option.default_value_);
    }
    fmt::format_to(it, "\n");
  }

  return out;
}

auto ArgumentParser::find(std::string_view name) const noexcept -> Option const* {
  auto it = std::ranges::find_if(options_, [name](Option const& option) { return option.name_ == name; });
  return it != options_.end() ? &*it : nullptr;
}

auto ArgumentParser::find(char short_name) const noexcept -> Option const* {
  auto it = std::ranges::find_if(options_, [short_name](Option const& option) {
    return option.short_name_ == short_name;
  });
  return it != options_.end() ? &*it : nullptr;
}

auto ArgumentParser::record(Arguments& args, Option const& option, std::string_view spelled, std::string value)
    -> Result<void> {
  if (option.check_ && !option.check_(value)) {
    return configError(fmt::format("invalid value for option {}: {}", spelled, value));
  }
  args.values_[option.name_].push_back(value);
  args.occurrences_.emplace_back(option.name_, std::move(value));
  return {};
}

auto create_envtpl_parser() -> ArgumentParser {
  // clang-format off
  ArgumentParser parser{std::string(EXE_NAME), std::string(EXE_DESC)};
  parser.positional("FILE");

  parser.add_argument("text", 't')
    .value()
    .desc("Render the given text");
  parser.add_argument("input", 'i')
    .value()
    .desc("Render a template file ('-' for standard input)");
  parser.add_argument("directory", 'd')
    .value()
    .desc("Render every matching file below a directory");
  parser.add_argument("output", 'o')
    .value()
    .desc("Output file, or output root with --directory; standard output when absent");
  parser.add_argument("recursive", 'r')
    .desc("Descend into subdirectories of --directory");
  parser.add_argument("extension", 'x')
    .value()
    .default_value(std::string(DEFAULT_EXTENSION))
    .desc("Suffix of template files in --directory");
  parser.add_argument("env", 'e')
    .value()
    .check([](std::string_view value) { return value.find('=') != std::string_view::npos; })
    .desc("Set a variable, NAME=VALUE (repeatable)");
  parser.add_argument("env-file", 'f')
    .value()
    .desc("Load NAME=VALUE lines from a file (repeatable); later sources win");
  parser.add_argument("no-environ")
    .desc("Do not seed variables from the process environment");
  parser.add_argument("silent", 's')
    .desc("Leave unresolved placeholders in place instead of failing");
  parser.add_argument("expand-vars", 'E')
    .desc("Follow values of the form $NAME to another variable");
  parser.add_argument("dry-run", 'n')
    .desc("Render but do not write; report what would be written");
  parser.add_argument("verbose", 'v')
    .desc("Enable verbose output");
  parser.add_argument("quiet", 'q')
    .desc("Only report errors");
  parser.add_argument("help", 'h')
    .desc("Show help message");
  parser.add_argument("version")
    .desc("Show version message");

  return parser;
  // clang-format on
}

void print_version() {
  fmt::print("{} {}\n", EXE_NAME, VERSION);
}

} // namespace envtpl::cli
