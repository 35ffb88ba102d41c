#pragma once

#include <cstdlib>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace vcr::common {

/// Log an unrecoverable command line failure, flush every sink and exit.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::exit(EXIT_FAILURE);
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::exit(EXIT_FAILURE);
}

}  // namespace vcr::common
