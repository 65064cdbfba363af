/* Leveled diagnostic logging.
 *
 * Messages are assembled from any streamable arguments and written as a
 * single line to std::clog. The threshold defaults to Warn and can be set
 * programmatically or through ENSGRAPH_LOG_LEVEL
 * (trace|debug|info|warn|error|quiet), read once on first use.
 */
#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace ensgraph::core::log {

enum class Level { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Quiet = 5 };

void set_level(Level level) noexcept;
[[nodiscard]] Level level() noexcept;
[[nodiscard]] bool enabled(Level level) noexcept;

// Parses a level name; unknown names map to Warn.
[[nodiscard]] Level parse_level(std::string_view name) noexcept;

void write(Level level, const char* location, const std::string& message);

template <typename... Args>
void print(Level lvl, const char* location, Args&&... args) {
  if (!enabled(lvl)) return;
  std::ostringstream os;
  (os << ... << std::forward<Args>(args));
  write(lvl, location, os.str());
}

} // namespace ensgraph::core::log

#define ENSGRAPH_LOG_STRINGIFY_(x) #x
#define ENSGRAPH_LOG_STRINGIFY(x) ENSGRAPH_LOG_STRINGIFY_(x)
#define ENSGRAPH_LOG_LOCATION __FILE__ ":" ENSGRAPH_LOG_STRINGIFY(__LINE__)

#define ENSGRAPH_TRACE(...) ::ensgraph::core::log::print(::ensgraph::core::log::Level::Trace, ENSGRAPH_LOG_LOCATION, __VA_ARGS__)
#define ENSGRAPH_DEBUG(...) ::ensgraph::core::log::print(::ensgraph::core::log::Level::Debug, ENSGRAPH_LOG_LOCATION, __VA_ARGS__)
#define ENSGRAPH_INFO(...)  ::ensgraph::core::log::print(::ensgraph::core::log::Level::Info,  ENSGRAPH_LOG_LOCATION, __VA_ARGS__)
#define ENSGRAPH_WARN(...)  ::ensgraph::core::log::print(::ensgraph::core::log::Level::Warn,  ENSGRAPH_LOG_LOCATION, __VA_ARGS__)
#define ENSGRAPH_ERROR(...) ::ensgraph::core::log::print(::ensgraph::core::log::Level::Error, ENSGRAPH_LOG_LOCATION, __VA_ARGS__)
