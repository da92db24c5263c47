#include "catch2/catch_all.hpp"

#include <config.hpp>

#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace ns = valkyrie;

namespace {

std::optional<ns::config> parse(std::vector<const char *> args,
                                std::size_t parallelism = 8,
                                const char *shards_env = nullptr) {
  args.insert(args.begin(), "valkyrie-server");
  std::ostringstream out;
  return ns::parse_config(int(args.size()), args.data(), out, parallelism,
                          shards_env);
}

} // namespace

TEST_CASE("defaults") {
  const auto cfg = parse({});
  REQUIRE(cfg);
  CHECK(cfg->address == "0.0.0.0");
  CHECK(cfg->port == 6379);
  CHECK(cfg->threads == 4);
  CHECK(cfg->shards == 4);
  CHECK(cfg->mode == ns::listener_mode::reuseport);
  CHECK(cfg->log_level == ns::log::level::info);
  CHECK(cfg->input_buffer_bytes == 1 << 20);
}

TEST_CASE("a single core gets one of everything") {
  const auto cfg = parse({}, 1);
  REQUIRE(cfg);
  CHECK(cfg->threads == 1);
  CHECK(cfg->shards == 1);
}

TEST_CASE("shards from the environment") {
  CHECK(parse({}, 16, "3")->shards == 3);
  CHECK(parse({}, 16, "100")->shards == 8);
  CHECK(parse({}, 16, "0")->shards == 8);
  CHECK(parse({}, 16, "bogus")->shards == 8);
  CHECK(parse({}, 16, "")->shards == 8);
  CHECK(parse({"--shards", "2"}, 16, "3")->shards == 2);
}

TEST_CASE("explicit counts are clamped") {
  const auto cfg = parse({"--threads", "2", "--shards", "100"});
  REQUIRE(cfg);
  CHECK(cfg->threads == 2);
  CHECK(cfg->shards == 4);
}

TEST_CASE("every option") {
  const auto cfg = parse({"--address", "127.0.0.1", "--port", "0", "--mode",
                          "dispatcher", "--log-level", "DEBUG",
                          "--input-buffer", "5000"});
  REQUIRE(cfg);
  CHECK(cfg->address == "127.0.0.1");
  CHECK(cfg->port == 0);
  CHECK(cfg->mode == ns::listener_mode::dispatcher);
  CHECK(cfg->log_level == ns::log::level::debug);

  const auto page = std::size_t(::sysconf(_SC_PAGESIZE));
  CHECK(cfg->input_buffer_bytes >= 5000);
  CHECK(cfg->input_buffer_bytes % page == 0);
}

TEST_CASE("help") {
  std::vector<const char *> args{"valkyrie-server", "--help"};
  std::ostringstream out;
  CHECK(!ns::parse_config(int(args.size()), args.data(), out, 8, nullptr));
  CHECK(out.str().find("--port") != std::string::npos);
  CHECK(out.str().find("--mode") != std::string::npos);
}

TEST_CASE("invalid options") {
  auto args = GENERATE(values<std::vector<const char *>>({
      {"--threads", "0"},
      {"--shards", "-1"},
      {"--threads", "many"},
      {"--port", "70000"},
      {"--port", "-1"},
      {"--mode", "bogus"},
      {"--log-level", "loud"},
      {"--input-buffer", "0"},
      {"--no-such-option"},
  }));

  CHECK_THROWS_AS(parse(args), ns::config_error);
}

TEST_CASE("mode names") {
  CHECK(ns::mode_name(ns::listener_mode::reuseport) == "reuseport");
  CHECK(ns::mode_name(ns::listener_mode::dispatcher) == "dispatcher");
}
