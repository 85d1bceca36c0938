// include/mdh/log.hpp
#pragma once
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace mdh::log {

enum class Level { debug = 0, info, warn, error };

void set_level(Level lvl) noexcept;
Level level() noexcept;
bool enabled(Level lvl) noexcept;

// Writes "[level] component: message" to stderr.
void write(Level lvl, std::string_view component, std::string_view message);

template <typename... Args>
void debug(std::string_view component, fmt::format_string<Args...> f,
           Args &&...args) {
  if (enabled(Level::debug))
    write(Level::debug, component, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::string_view component, fmt::format_string<Args...> f,
          Args &&...args) {
  if (enabled(Level::info))
    write(Level::info, component, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::string_view component, fmt::format_string<Args...> f,
          Args &&...args) {
  if (enabled(Level::warn))
    write(Level::warn, component, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::string_view component, fmt::format_string<Args...> f,
           Args &&...args) {
  if (enabled(Level::error))
    write(Level::error, component, fmt::format(f, std::forward<Args>(args)...));
}

} // namespace mdh::log
