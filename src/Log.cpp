#include "envtpl/Log.hpp"
#include "envtpl/Constants.hpp"

#include <atomic>
#include <cstdio>

#include <fmt/core.h>

namespace envtpl::log {

namespace {

std::atomic<Level> current_level{Level::Normal};

} // namespace

void set_level(Level level) noexcept {
  current_level.store(level, std::memory_order_relaxed);
}

Level level() noexcept {
  return current_level.load(std::memory_order_relaxed);
}

void write(std::string_view prefix, std::string const& message) {
  fmt::print(stderr, "{}: {}{}\n", EXE_NAME, prefix, message);
}

} // namespace envtpl::log
