#ifndef VALKYRIE_LOG_HPP
#define VALKYRIE_LOG_HPP

#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

/**
 * Fire-and-forget event sink. Each event is a single line on stderr:
 *
 *   [12:34:56.789] [WARN] [event-loop-3] message
 */
namespace valkyrie::log {

enum class level { debug, info, warn, error };

void set_level(level l) noexcept;

[[nodiscard]] level current_level() noexcept;

[[nodiscard]] inline bool enabled(level l) noexcept {
  return l >= current_level();
}

std::optional<level> parse_level(std::string_view name);

std::string_view level_name(level l) noexcept;

/**
 * Name the calling thread in subsequent events.
 */
void set_thread_name(std::string name);

void write(level l, std::string_view message) noexcept;

template <typename... T>
void emit(level l, fmt::format_string<T...> format, T &&...args) {
  if (enabled(l))
    write(l, fmt::format(format, std::forward<T>(args)...));
}

template <typename... T>
void debug(fmt::format_string<T...> format, T &&...args) {
  emit(level::debug, format, std::forward<T>(args)...);
}

template <typename... T>
void info(fmt::format_string<T...> format, T &&...args) {
  emit(level::info, format, std::forward<T>(args)...);
}

template <typename... T>
void warn(fmt::format_string<T...> format, T &&...args) {
  emit(level::warn, format, std::forward<T>(args)...);
}

template <typename... T>
void error(fmt::format_string<T...> format, T &&...args) {
  emit(level::error, format, std::forward<T>(args)...);
}

} // namespace valkyrie::log

#endif // VALKYRIE_LOG_HPP
