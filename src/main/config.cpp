#include "config.hpp"

#include <algorithm>
#include <charconv>
#include <thread>

#include <unistd.h>

namespace {

namespace po = boost::program_options;

std::size_t positive(std::int64_t value, const char *name) {
  if (value < 1)
    throw valkyrie::config_error(std::string("--") + name +
                                 " must be at least 1");
  return std::size_t(value);
}

std::optional<std::size_t> shards_from_env(const char *env) {
  if (!env)
    return {};
  const std::string_view s(env);
  std::size_t result{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
  if (s.empty() || ec != std::errc() || ptr != s.data() + s.size() ||
      result == 0)
    return {};
  return result;
}

valkyrie::listener_mode parse_mode(const std::string &name) {
  if (name == "reuseport")
    return valkyrie::listener_mode::reuseport;
  if (name == "dispatcher")
    return valkyrie::listener_mode::dispatcher;
  throw valkyrie::config_error("--mode must be reuseport or dispatcher, not '" +
                               name + "'");
}

std::size_t page_aligned(std::size_t len) {
  const auto page = std::size_t(::sysconf(_SC_PAGESIZE));
  return (len + page - 1) / page * page;
}

} // namespace

std::size_t valkyrie::available_parallelism() noexcept {
  const auto n = std::thread::hardware_concurrency();
  return n ? n : 4;
}

po::options_description valkyrie::options_description() {
  po::options_description result("valkyrie-server options");
  // clang-format off
  result.add_options()
      ("help", "print this message and exit")
      ("address", po::value<std::string>()->default_value("0.0.0.0"),
           "IPv4 address to listen on")
      ("port", po::value<int>()->default_value(6379),
           "TCP port to listen on, 0 for an ephemeral port")
      ("threads", po::value<std::int64_t>(),
           "connection handler threads (default: available parallelism)")
      ("shards", po::value<std::int64_t>(),
           "storage shards (default: $SHARDS, else available parallelism)")
      ("mode", po::value<std::string>()->default_value("reuseport"),
           "listener mode: reuseport or dispatcher")
      ("log-level", po::value<std::string>()->default_value("info"),
           "debug, info, warn or error")
      ("input-buffer", po::value<std::int64_t>()->default_value(1 << 20),
           "per connection input buffer in bytes, bounds the request size");
  // clang-format on
  return result;
}

std::optional<valkyrie::config>
valkyrie::parse_config(int argc, const char *const argv[], std::ostream &out,
                       std::size_t parallelism, const char *shards_env) {
  const auto description = options_description();
  po::variables_map vm;

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error &e) {
    throw config_error(e.what());
  }

  if (vm.count("help")) {
    out << description << '\n';
    return {};
  }

  config result;
  result.address = vm["address"].as<std::string>();

  const auto port = vm["port"].as<int>();
  if (port < 0 || port > 65535)
    throw config_error("--port must be between 0 and 65535");
  result.port = static_cast<std::uint16_t>(port);

  parallelism = std::max<std::size_t>(parallelism, 1);
  const auto limit = std::max<std::size_t>(1, parallelism / 2);

  const auto threads = vm.count("threads")
                           ? positive(vm["threads"].as<std::int64_t>(),
                                      "threads")
                           : parallelism;

  const auto shards =
      vm.count("shards")
          ? positive(vm["shards"].as<std::int64_t>(), "shards")
          : shards_from_env(shards_env).value_or(parallelism);

  result.threads = std::clamp<std::size_t>(threads, 1, limit);
  result.shards = std::clamp<std::size_t>(shards, 1, limit);

  result.mode = parse_mode(vm["mode"].as<std::string>());

  const auto &level_name = vm["log-level"].as<std::string>();
  if (const auto l = log::parse_level(level_name))
    result.log_level = *l;
  else
    throw config_error("unknown --log-level '" + level_name + "'");

  result.input_buffer_bytes = page_aligned(
      positive(vm["input-buffer"].as<std::int64_t>(), "input-buffer"));

  return result;
}

std::string_view valkyrie::mode_name(listener_mode mode) noexcept {
  switch (mode) {
  case listener_mode::reuseport:
    return "reuseport";
  case listener_mode::dispatcher:
    return "dispatcher";
  }
  return "unknown";
}
