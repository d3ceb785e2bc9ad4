#pragma once

#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace raceswap::common {

/// Logs at critical level, flushes every sink and terminates. Only for
/// broken internal invariants and unusable command-line input; request
/// failures are reported through transaction results.
template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format,
                           Args&&... args) {
  spdlog::critical("{}", fmt::format(format, std::forward<Args>(args)...));
  spdlog::shutdown();
  std::terminate();
}

}  // namespace raceswap::common
