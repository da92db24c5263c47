#ifndef VALKYRIE_COMMANDS_HPP
#define VALKYRIE_COMMANDS_HPP

#include "engine.hpp"
#include "request.hpp"
#include "resp.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace valkyrie::commands {

/**
 * A request that can't be executed. what() is the complete RESP error text.
 */
class command_error : public std::runtime_error {
public:
  using runtime_error::runtime_error;
};

enum class command_id {
  ping,
  echo,
  set,
  get,
  del,
  exists,
  lpush,
  rpush,
  lpop,
  llen,
  lrange,
  blpop,
  command,
};

/**
 * Resolve a command name, ignoring case.
 */
std::optional<command_id> lookup(std::string_view name);

/**
 * The lower case name of cmd.
 */
std::string_view name(command_id cmd);

/**
 * A BLPOP that found every candidate list empty. Whoever drives the
 * connection waits on the keys and replies with reply_popped().
 */
struct blocking_pop {
  std::vector<std::string> keys;
  engine::duration timeout; // zero waits forever
};

using outcome_t = std::variant<std::monostate, blocking_pop>;

/**
 * Execute args against db. Unless the result is a blocking_pop, exactly one
 * reply (possibly an error) has been written to output. An empty request
 * produces no reply.
 */
outcome_t dispatch(const args_t &args, engine &db, resp::handler &output);

/**
 * Reply to a blocking pop: [key, element], or the nil array on timeout.
 */
void reply_popped(resp::handler &output,
                  const std::optional<engine::popped_t> &popped);

} // namespace valkyrie::commands

#endif // VALKYRIE_COMMANDS_HPP
