#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace envtpl::log {

enum class Level {
  Quiet,   // errors only
  Normal,  // errors, warnings and reports
  Verbose, // everything
};

void  set_level(Level level) noexcept;
Level level() noexcept;

void write(std::string_view prefix, std::string const& message);

template<typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
  write("error: ", fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) {
  if (level() >= Level::Normal) {
    write("warning: ", fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
  if (level() >= Level::Normal) {
    write("", fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
  if (level() >= Level::Verbose) {
    write("", fmt::format(format, std::forward<Args>(args)...));
  }
}

} // namespace envtpl::log
