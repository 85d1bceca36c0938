// src/log.cpp
#include "mdh/log.hpp"

#include <cstdio>

#include <fmt/format.h>

namespace mdh::log {
namespace {
Level g_level = Level::warn;

const char *level_name(Level lvl) noexcept {
  switch (lvl) {
  case Level::debug:
    return "debug";
  case Level::info:
    return "info";
  case Level::warn:
    return "warn";
  case Level::error:
    return "error";
  }
  return "?";
}
} // namespace

void set_level(Level lvl) noexcept { g_level = lvl; }
Level level() noexcept { return g_level; }
bool enabled(Level lvl) noexcept { return lvl >= g_level; }

void write(Level lvl, std::string_view component, std::string_view message) {
  fmt::print(stderr, "[{}] {}: {}\n", level_name(lvl), component, message);
}

} // namespace mdh::log
