#include <catch2/catch_all.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "checked_writer.hpp"

#include <commands.hpp>

#include <chrono>

namespace ns = valkyrie::commands;
using namespace std::literals;

namespace {

constexpr std::string_view wrongtype =
    "-WRONGTYPE Operation against a key holding the wrong kind of value\r\n";

class fixture {
protected:
  std::string submit(const valkyrie::args_t &args) {
    valkyrie::test::checked_writer output;
    outcome_ = ns::dispatch(args, db_, output);
    CHECK(output.balanced());
    return output.str();
  }

  [[nodiscard]] bool blocked() const {
    return std::holds_alternative<ns::blocking_pop>(outcome_);
  }

  valkyrie::engine db_{4};
  ns::outcome_t outcome_;
};

} // namespace

TEST_CASE("lookup ignores case") {
  CHECK(ns::lookup("blpop") == ns::command_id::blpop);
  CHECK(ns::lookup("BLPOP") == ns::command_id::blpop);
  CHECK(ns::lookup("LrAnGe") == ns::command_id::lrange);
  CHECK(!ns::lookup("blpo"));
  CHECK(!ns::lookup("blpopx"));
  CHECK(ns::name(ns::command_id::lpush) == "lpush");
}

TEST_CASE_METHOD(fixture, "ping") {
  const auto result = submit({"PINg"});
  CHECK(result == "+PONG\r\n");
  CHECK(!blocked());
}

TEST_CASE_METHOD(fixture, "ping with msg") {
  const auto result = submit({"PInG", "msg"});
  CHECK(result == "$3\r\nmsg\r\n");
}

TEST_CASE_METHOD(fixture, "ping with too many arguments") {
  CHECK(submit({"ping", "a", "b"}) ==
        "-ERR wrong number of arguments for 'ping' command\r\n");
}

TEST_CASE_METHOD(fixture, "echo") {
  const auto result = submit({"EcHO", "msg"});
  CHECK(result == "$3\r\nmsg\r\n");
}

TEST_CASE_METHOD(fixture, "set get and del") {
  CHECK(submit({"SeT", "key", "value"}) == "+OK\r\n");
  CHECK(submit({"gET", "key"}) == "$5\r\nvalue\r\n");
  CHECK(submit({"del", "key"}) == ":1\r\n");
  CHECK(submit({"gET", "key"}) == "$-1\r\n");
}

TEST_CASE_METHOD(fixture, "failed get") {
  const auto result = submit({"gET", "key"});
  CHECK(result == "$-1\r\n");
}

TEST_CASE_METHOD(fixture, "set with options") {
  auto option = GENERATE(as<std::string>{}, "EX", "PX", "NX", "KEEPTTL");
  CHECK(submit({"SET", "key", "value", option, "10"}) ==
        "-ERR syntax error\r\n");
  CHECK(submit({"GET", "key"}) == "$-1\r\n");
}

TEST_CASE_METHOD(fixture, "exists") {
  submit({"SeT", "key1", "value1"});
  submit({"SeT", "key3", "value3"});
  const auto result = submit({"eXiSts", "key1", "key2", "key3"});
  CHECK(result == ":2\r\n");
}

TEST_CASE_METHOD(fixture, "del counts what existed") {
  submit({"set", "a", "1"});
  submit({"rpush", "b", "1"});
  CHECK(submit({"del", "a", "b", "c"}) == ":2\r\n");
}

TEST_CASE_METHOD(fixture, "rpush") {
  CHECK(submit({"RpUsH", "key", "a", "b", "c"}) == ":3\r\n");
  CHECK(submit({"lrange", "key", "0", "2"}) ==
        "*3\r\n$1\r\na\r\n$1\r\nb\r\n$1\r\nc\r\n");
  CHECK(submit({"get", "key"}) == wrongtype);
  CHECK(submit({"del", "key"}) == ":1\r\n");
  CHECK(submit({"get", "key"}) == "$-1\r\n");
}

TEST_CASE_METHOD(fixture, "lpush") {
  CHECK(submit({"LPUSH", "key", "a", "b"}) == ":2\r\n");
  CHECK(submit({"LPUSH", "key", "c"}) == ":3\r\n");
  CHECK(submit({"lrange", "key", "0", "-1"}) ==
        "*3\r\n$1\r\nc\r\n$1\r\nb\r\n$1\r\na\r\n");
}

TEST_CASE_METHOD(fixture, "push onto a string") {
  submit({"set", "key", "value"});
  CHECK(submit({"lpush", "key", "a"}) == wrongtype);
  CHECK(submit({"rpush", "key", "a"}) == wrongtype);
  CHECK(submit({"get", "key"}) == "$5\r\nvalue\r\n");
}

TEST_CASE_METHOD(fixture, "lrange arguments") {
  CHECK(submit({"RpUsH", "key", "a", "b", "c"}) == ":3\r\n");
  CHECK(submit({"lrange", "key", "0", "2"}) ==
        "*3\r\n$1\r\na\r\n$1\r\nb\r\n$1\r\nc\r\n");
  CHECK(submit({"lrange", "key", "0", "1"}) ==
        "*2\r\n$1\r\na\r\n$1\r\nb\r\n");
  CHECK(submit({"lrange", "key", "1", "2"}) ==
        "*2\r\n$1\r\nb\r\n$1\r\nc\r\n");
  CHECK(submit({"lrange", "key", "-2", "-1"}) ==
        "*2\r\n$1\r\nb\r\n$1\r\nc\r\n");
  CHECK(submit({"lrange", "key", "2", "1"}) == "*0\r\n");
  CHECK(submit({"get", "key"}) == wrongtype);
  CHECK(submit({"del", "key"}) == ":1\r\n");
  CHECK(submit({"get", "key"}) == "$-1\r\n");
  CHECK(submit({"lrange", "missing", "-2", "-1"}) == "*0\r\n");
}

TEST_CASE_METHOD(fixture, "lrange with bad indices") {
  submit({"rpush", "key", "a"});
  CHECK(submit({"lrange", "key", "zero", "1"}) ==
        "-ERR value is not an integer or out of range\r\n");
  CHECK(submit({"lrange", "key", "0", "1.5"}) ==
        "-ERR value is not an integer or out of range\r\n");
  CHECK(submit({"lrange", "key", "0", "99999999999999999999"}) ==
        "-ERR value is not an integer or out of range\r\n");
}

TEST_CASE_METHOD(fixture, "lpop and llen") {
  submit({"rpush", "key", "a", "b", "c"});
  CHECK(submit({"llen", "key"}) == ":3\r\n");
  CHECK(submit({"lpop", "key"}) == "$1\r\na\r\n");
  CHECK(submit({"llen", "key"}) == ":2\r\n");
  CHECK(submit({"lpop", "key", "5"}) == "*2\r\n$1\r\nb\r\n$1\r\nc\r\n");
  CHECK(submit({"llen", "key"}) == ":0\r\n");
  CHECK(submit({"exists", "key"}) == ":0\r\n");
  CHECK(submit({"lpop", "key"}) == "$-1\r\n");
  CHECK(submit({"lpop", "key", "2"}) == "*-1\r\n");
}

TEST_CASE_METHOD(fixture, "lpop with a negative count") {
  submit({"rpush", "key", "a"});
  CHECK(submit({"lpop", "key", "-1"}) ==
        "-ERR value is out of range, must be positive\r\n");
  CHECK(submit({"llen", "key"}) == ":1\r\n");
}

TEST_CASE_METHOD(fixture, "llen of a string") {
  submit({"set", "key", "value"});
  CHECK(submit({"llen", "key"}) == wrongtype);
}

TEST_CASE_METHOD(fixture, "unknown command") {
  CHECK(submit({"FOO", "bar"}) == "-ERR unknown command 'FOO'\r\n");
  CHECK(!blocked());
}

TEST_CASE_METHOD(fixture, "unknown command with a line break in its name") {
  CHECK(submit({"FOO\r\n+OK"}) == "-ERR unknown command 'FOO  +OK'\r\n");
}

TEST_CASE_METHOD(fixture, "wrong number of arguments") {
  auto [args, name] = GENERATE(table<valkyrie::args_t, std::string>({
      {{"GET"}, "get"},
      {{"get", "a", "b"}, "get"},
      {{"SET", "a"}, "set"},
      {{"echo"}, "echo"},
      {{"Del"}, "del"},
      {{"exists"}, "exists"},
      {{"lpush", "a"}, "lpush"},
      {{"rpush", "a"}, "rpush"},
      {{"lpop"}, "lpop"},
      {{"lpop", "a", "1", "2"}, "lpop"},
      {{"llen"}, "llen"},
      {{"lrange", "a", "0"}, "lrange"},
      {{"blpop", "a"}, "blpop"},
  }));

  CHECK(submit(args) ==
        "-ERR wrong number of arguments for '" + name + "' command\r\n");
}

TEST_CASE_METHOD(fixture, "empty request has no reply") {
  CHECK(submit({}).empty());
  CHECK(!blocked());
}

TEST_CASE_METHOD(fixture, "command") {
  CHECK(submit({"COMMAND"}) == "*0\r\n");
  CHECK(submit({"command", "docs"}) == "*0\r\n");
}

TEST_CASE_METHOD(fixture, "blpop with an element ready") {
  submit({"rpush", "b", "x", "y"});
  CHECK(submit({"BLPOP", "a", "b", "0"}) ==
        "*2\r\n$1\r\nb\r\n$1\r\nx\r\n");
  CHECK(!blocked());
  CHECK(submit({"lrange", "b", "0", "-1"}) == "*1\r\n$1\r\ny\r\n");
}

TEST_CASE_METHOD(fixture, "blpop on empty lists blocks") {
  CHECK(submit({"blpop", "a", "b", "1.5"}).empty());
  REQUIRE(blocked());

  const auto &pop = std::get<ns::blocking_pop>(outcome_);
  CHECK(pop.keys == std::vector<std::string>{"a", "b"});
  CHECK(pop.timeout == 1500ms);
}

TEST_CASE_METHOD(fixture, "blpop with a zero timeout waits forever") {
  CHECK(submit({"blpop", "a", "0"}).empty());
  REQUIRE(blocked());
  CHECK(std::get<ns::blocking_pop>(outcome_).timeout ==
        valkyrie::engine::duration::zero());
}

TEST_CASE_METHOD(fixture, "blpop with a tiny timeout still times out") {
  CHECK(submit({"blpop", "a", "0.0000000001"}).empty());
  REQUIRE(blocked());
  CHECK(std::get<ns::blocking_pop>(outcome_).timeout >
        valkyrie::engine::duration::zero());
}

TEST_CASE_METHOD(fixture, "blpop with a bad timeout") {
  auto timeout =
      GENERATE(as<std::string>{}, "abc", "", "1s", "inf", "nan", "1e20",
               "9500000000");
  CHECK(submit({"blpop", "a", timeout}) ==
        "-ERR timeout is not a float or out of range\r\n");
  CHECK(!blocked());
}

TEST_CASE_METHOD(fixture, "blpop with a timeout of a century") {
  submit({"blpop", "a", "3155760000"});
  REQUIRE(blocked());
  CHECK(std::get<ns::blocking_pop>(outcome_).timeout ==
        std::chrono::hours(24 * 36525));
}

TEST_CASE_METHOD(fixture, "blpop with a negative timeout") {
  CHECK(submit({"blpop", "a", "-1"}) == "-ERR timeout is negative\r\n");
  CHECK(!blocked());
}

TEST_CASE_METHOD(fixture, "blpop on a string") {
  submit({"set", "a", "value"});
  CHECK(submit({"blpop", "a", "0"}) == wrongtype);
  CHECK(!blocked());
}

TEST_CASE("reply_popped") {
  valkyrie::test::checked_writer output;
  ns::reply_popped(output, valkyrie::engine::popped_t{"q", "x"});
  ns::reply_popped(output, std::nullopt);
  CHECK(output.str() == "*2\r\n$1\r\nq\r\n$1\r\nx\r\n*-1\r\n");
}
