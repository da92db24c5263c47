#include "commands.hpp"
#include "util.hpp"

#include <array>
#include <charconv>
#include <chrono>
#include <cmath>
#include <span>

namespace {

namespace ns = valkyrie::commands;
using ns::command_error;
using ns::command_id;
using valkyrie::args_t;
using valkyrie::engine;
using valkyrie::resp::handler;

struct command_info {
  std::string_view name;
  command_id id;
  // a positive arity is exact, a negative one is a minimum
  int arity;
};

constexpr std::array<command_info, 13> command_table{{
    {"ping", command_id::ping, -1},
    {"echo", command_id::echo, 2},
    {"set", command_id::set, -3},
    {"get", command_id::get, 2},
    {"del", command_id::del, -2},
    {"exists", command_id::exists, -2},
    {"lpush", command_id::lpush, -3},
    {"rpush", command_id::rpush, -3},
    {"lpop", command_id::lpop, -2},
    {"llen", command_id::llen, 2},
    {"lrange", command_id::lrange, 4},
    {"blpop", command_id::blpop, -3},
    {"command", command_id::command, -1},
}};

const command_info &info(command_id id) {
  return command_table[static_cast<std::size_t>(id)];
}

command_error wrong_arity(command_id id) {
  return command_error(std::string("ERR wrong number of arguments for '") +
                       std::string(info(id).name) + "' command");
}

void check_arity(command_id id, const args_t &args) {
  const auto arity = info(id).arity;
  const auto n = std::int64_t(args.size());
  if (arity >= 0 ? n != arity : n < -arity)
    throw wrong_arity(id);
}

std::int64_t parse_int(std::string_view s) {
  std::int64_t result{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
  if (s.empty() || ptr != s.data() + s.size() || ec != std::errc())
    throw command_error("ERR value is not an integer or out of range");
  return result;
}

// half the clock's range, so that now() + timeout can't overflow either
constexpr double max_timeout_seconds =
    std::chrono::duration<double>(engine::duration::max()).count() / 2;

/**
 * Seconds as a non-negative decimal, e.g. "0.05".
 */
engine::duration parse_timeout(std::string_view s) {
  double seconds{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), seconds);
  if (s.empty() || ptr != s.data() + s.size() || ec != std::errc() ||
      !std::isfinite(seconds) || seconds > max_timeout_seconds)
    throw command_error("ERR timeout is not a float or out of range");
  if (seconds < 0)
    throw command_error("ERR timeout is negative");

  auto result = std::chrono::duration_cast<engine::duration>(
      std::chrono::duration<double>(seconds));
  // a tiny positive timeout must not turn into "forever"
  if (seconds > 0 && result == engine::duration::zero())
    result = engine::duration(1);
  return result;
}

std::span<const std::string_view> tail(const args_t &args, std::size_t from) {
  return std::span(args).subspan(from);
}

void reply_array(handler &output, const std::vector<std::string> &values) {
  output.begin_array(std::int64_t(values.size()));
  for (const auto &value : values)
    valkyrie::resp::bulk_string(output, value);
  output.end_array();
}

void cmd_ping(const args_t &args, handler &output) {
  switch (args.size()) {
  case 1:
    return valkyrie::resp::simple_string(output, "PONG");
  case 2:
    return valkyrie::resp::bulk_string(output, args[1]);
  default:
    throw wrong_arity(command_id::ping);
  }
}

void cmd_set(const args_t &args, engine &db, handler &output) {
  // expiry and conditional options aren't supported
  if (args.size() != 3)
    throw command_error("ERR syntax error");
  db.set(args[1], args[2]);
  valkyrie::resp::simple_string(output, "OK");
}

void cmd_get(const args_t &args, engine &db, handler &output) {
  if (const auto value = db.get_string(args[1]))
    valkyrie::resp::bulk_string(output, *value);
  else
    valkyrie::resp::nil_string(output);
}

template <typename Predicate>
void count_keys(const args_t &args, handler &output, Predicate predicate) {
  std::int64_t count{};
  for (const auto &key : tail(args, 1)) {
    if (predicate(key))
      ++count;
  }
  valkyrie::resp::integer(output, count);
}

void cmd_lpop(const args_t &args, engine &db, handler &output) {
  switch (args.size()) {
  case 2:
    if (const auto element = db.lpop(args[1]))
      valkyrie::resp::bulk_string(output, *element);
    else
      valkyrie::resp::nil_string(output);
    return;
  case 3: {
    const auto count = parse_int(args[2]);
    if (count < 0)
      throw command_error("ERR value is out of range, must be positive");
    if (const auto elements = db.lpop(args[1], std::size_t(count)))
      reply_array(output, *elements);
    else
      valkyrie::resp::nil_array(output);
    return;
  }
  default:
    throw wrong_arity(command_id::lpop);
  }
}

void cmd_lrange(const args_t &args, engine &db, handler &output) {
  const auto start = parse_int(args[2]);
  const auto stop = parse_int(args[3]);
  reply_array(output, db.lrange(args[1], start, stop));
}

ns::outcome_t cmd_blpop(const args_t &args, engine &db, handler &output) {
  const auto timeout = parse_timeout(args.back());
  const auto keys = std::span(args).subspan(1, args.size() - 2);

  if (auto popped = db.try_pop_first(keys)) {
    ns::reply_popped(output, popped);
    return {};
  }

  return ns::blocking_pop{
      std::vector<std::string>(keys.begin(), keys.end()), timeout};
}

ns::outcome_t execute(command_id id, const args_t &args, engine &db,
                      handler &output) {
  check_arity(id, args);

  switch (id) {
  case command_id::ping:
    cmd_ping(args, output);
    break;
  case command_id::echo:
    valkyrie::resp::bulk_string(output, args[1]);
    break;
  case command_id::set:
    cmd_set(args, db, output);
    break;
  case command_id::get:
    cmd_get(args, db, output);
    break;
  case command_id::del:
    count_keys(args, output, [&](auto key) { return db.del(key); });
    break;
  case command_id::exists:
    count_keys(args, output, [&](auto key) { return db.exists(key); });
    break;
  case command_id::lpush:
    valkyrie::resp::integer(output, db.lpush(args[1], tail(args, 2)));
    break;
  case command_id::rpush:
    valkyrie::resp::integer(output, db.rpush(args[1], tail(args, 2)));
    break;
  case command_id::lpop:
    cmd_lpop(args, db, output);
    break;
  case command_id::llen:
    valkyrie::resp::integer(output, db.llen(args[1]));
    break;
  case command_id::lrange:
    cmd_lrange(args, db, output);
    break;
  case command_id::blpop:
    return cmd_blpop(args, db, output);
  case command_id::command:
    // clients only probe this for compatibility
    output.begin_array(0);
    output.end_array();
    break;
  }
  return {};
}

} // namespace

std::optional<ns::command_id> ns::lookup(std::string_view name) {
  const valkyrie::util::ci_equal eq;
  for (const auto &entry : command_table) {
    if (eq(entry.name, name))
      return entry.id;
  }
  return {};
}

std::string_view ns::name(command_id cmd) { return info(cmd).name; }

ns::outcome_t ns::dispatch(const args_t &args, engine &db, handler &output) {
  if (args.empty())
    return {};

  try {
    if (const auto id = lookup(args[0]))
      return execute(*id, args, db, output);
    throw command_error("ERR unknown command '" + std::string(args[0]) + "'");
  } catch (const command_error &e) {
    resp::error(output, e.what());
  } catch (const valkyrie::wrong_type &e) {
    resp::error(output, e.what());
  }
  return {};
}

void ns::reply_popped(handler &output,
                      const std::optional<engine::popped_t> &popped) {
  if (popped) {
    const auto &[key, element] = *popped;
    output.begin_array(2);
    resp::bulk_string(output, key);
    resp::bulk_string(output, element);
    output.end_array();
  } else {
    resp::nil_array(output);
  }
}
