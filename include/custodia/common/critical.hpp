#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace custodia::common {

/// Report a broken invariant and stop the process.
///
/// Reserved for conditions no caller can recover from (a collaborator that
/// violated its contract, a store that was mutated behind the engine).
/// Expected failures are returned as result codes instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("Invariant violated: {}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename Arg, typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Arg, Args...> format,
                           Arg&& arg,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Arg>(arg),
                   std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace custodia::common
