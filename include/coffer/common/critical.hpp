#pragma once

#include <csignal>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace coffer::common {

/// Log, flush and terminate. Reserved for storage states the ledger cannot
/// recover from (database not open, undecodable record, failed write).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// Same as above with the backend detail (usually a status string) folded
/// into the message.
template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format,
                           Args&&... args)
  requires(sizeof...(Args) > 0)
{
  auto message = fmt::format(format, std::forward<Args>(args)...);
  critical(std::string_view{message});
}

}  // namespace coffer::common
