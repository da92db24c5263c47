#ifndef VALKYRIE_CONFIG_HPP
#define VALKYRIE_CONFIG_HPP

#include "log.hpp"

#include <boost/program_options.hpp>

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace valkyrie {

class config_error : public std::runtime_error {
public:
  using runtime_error::runtime_error;
};

enum class listener_mode {
  // every event loop listens on its own SO_REUSEPORT socket
  reuseport,
  // the first event loop accepts and deals connections out round-robin
  dispatcher,
};

struct config {
  std::string address = "0.0.0.0";
  std::uint16_t port = 6379;
  std::size_t threads = 1;
  std::size_t shards = 1;
  listener_mode mode = listener_mode::reuseport;
  log::level log_level = log::level::info;
  std::size_t input_buffer_bytes = 1 << 20;
};

/**
 * Detected hardware parallelism, or 4 if it can't be detected.
 */
std::size_t available_parallelism() noexcept;

boost::program_options::options_description options_description();

/**
 * Build the configuration from the command line.
 *
 * Thread and shard counts default to the parallelism (shards prefer the
 * SHARDS environment variable) and are then clamped to [1, parallelism / 2].
 *
 * @return nothing if --help was requested, in which case usage has been
 *         written to out
 * @throws config_error on a malformed or out of range option
 */
std::optional<config>
parse_config(int argc, const char *const argv[], std::ostream &out,
             std::size_t parallelism = available_parallelism(),
             const char *shards_env = std::getenv("SHARDS"));

std::string_view mode_name(listener_mode mode) noexcept;

} // namespace valkyrie

#endif // VALKYRIE_CONFIG_HPP
