#pragma once

// pathrouter::log is spdlog when PATHROUTER_ENABLE_SPDLOG is defined.
// Otherwise, a minimal stderr logger covering the calls made by the library.
#ifdef PATHROUTER_ENABLE_SPDLOG
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export
#else
#include <fmt/format.h>

#include <cstdio>
#include <utility>
#endif

namespace pathrouter {
#ifdef PATHROUTER_ENABLE_SPDLOG
namespace log = spdlog;
#else
namespace log {

struct level {
  using level_enum = int;
  static constexpr level_enum debug = 1;
  static constexpr level_enum info = 2;
  static constexpr level_enum err = 4;
};

// Debug messages are compiled in but filtered out, as spdlog does by default.
inline constexpr level::level_enum get_level() noexcept { return level::info; }

template <typename... Args>
void debug(fmt::format_string<Args...> fmt, Args &&...args) {
  if (get_level() <= level::debug) {
    fmt::print(stderr, "[pathrouter] [debug] {}\n", fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template <typename... Args>
void error(fmt::format_string<Args...> fmt, Args &&...args) {
  fmt::print(stderr, "[pathrouter] [error] {}\n", fmt::format(fmt, std::forward<Args>(args)...));
}

}  // namespace log
#endif

}  // namespace pathrouter
