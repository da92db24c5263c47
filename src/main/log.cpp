#include "log.hpp"
#include "util.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace {

namespace ns = valkyrie::log;

std::atomic<ns::level> min_level{ns::level::info};

thread_local std::string thread_name = "main";

constexpr std::array<std::string_view, 4> level_names{"DEBUG", "INFO", "WARN",
                                                      "ERROR"};

} // namespace

void ns::set_level(level l) noexcept {
  min_level.store(l, std::memory_order_relaxed);
}

ns::level ns::current_level() noexcept {
  return min_level.load(std::memory_order_relaxed);
}

std::optional<ns::level> ns::parse_level(std::string_view name) {
  const valkyrie::util::ci_equal eq;
  for (std::size_t i = 0; i < level_names.size(); ++i) {
    if (eq(level_names[i], name))
      return static_cast<level>(i);
  }
  if (eq(name, "warning"))
    return level::warn;
  return {};
}

std::string_view ns::level_name(level l) noexcept {
  return level_names[static_cast<std::size_t>(l)];
}

void ns::set_thread_name(std::string name) { thread_name = std::move(name); }

void ns::write(level l, std::string_view message) noexcept {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch())
                      .count() %
                  1000;
  std::tm tm{};
  ::localtime_r(&t, &tm);

  // one fwrite per event so that concurrent lines don't interleave
  std::array<char, 512> buf{};
  const auto result = fmt::format_to_n(
      buf.data(), buf.size() - 1, "[{:02}:{:02}:{:02}.{:03}] [{}] [{}] {}\n",
      tm.tm_hour, tm.tm_min, tm.tm_sec, ms, level_name(l), thread_name,
      message);

  if (result.size < buf.size()) {
    std::fwrite(buf.data(), 1, result.size, stderr);
  } else {
    // too long for the stack buffer, truncate but keep the line terminated
    buf[buf.size() - 2] = '\n';
    std::fwrite(buf.data(), 1, buf.size() - 1, stderr);
  }
}
