#include "catch2/catch_all.hpp"

#include <string>
#include <string_view>
#include <util.hpp>
#include <vector>

namespace ns = valkyrie::util;
using namespace std::literals;

TEST_CASE("ci_hash") {
  ns::ci_hash h;
  CHECK(h("hello world"s) != 0);
  CHECK(h("hello world"s) == h("Hello World"sv));
  CHECK(h("hello world") == h("HellO WorlD"s));
}

TEST_CASE("ci_equal") {
  ns::ci_equal eq;
  CHECK(eq("hello world"sv, "Hello World"s));
  CHECK(eq("hello world\xff"sv, "Hello World\xff"s));
  CHECK(!eq("hello"sv, "hello "sv));
  CHECK(!eq("blpop"sv, "blpoq"sv));
}

TEST_CASE("cs_hash is case sensitive and binary safe") {
  ns::cs_hash h;
  CHECK(h("key"sv) == h("key"s));
  CHECK(h("key"sv) != h("KEY"sv));
  CHECK(h("a\0b"sv) != h("a\0c"sv));
}

TEST_CASE("to_lower only folds ascii") {
  CHECK(ns::to_lower("BLPop") == "blpop");
  CHECK(ns::to_lower("\xC3\x89T\xC3\x89") == "\xC3\x89t\xC3\x89");
}

TEST_CASE("tokenize a whole string") {
  const std::vector<std::string_view> expected{
      "hello", "world", "here's", "a", "token",
  };
  const std::string_view input(" hello  world here's   a token   ");
  std::vector<std::string_view> result;
  ns::tokenize(input.data(), input.data() + input.size(), [&](auto b, auto e) {
    result.emplace_back(b, e - b);
    return true;
  });
  REQUIRE(result.size() == 5);
  REQUIRE(result == expected);
}

TEST_CASE("tokenize early exit") {
  const std::vector<std::string_view> expected{
      "hello",
  };
  const std::string_view input(" hello  world here's   a token   ");
  std::vector<std::string_view> result;
  ns::tokenize(input.data(), input.data() + input.size(), [&](auto b, auto e) {
    result.emplace_back(b, e - b);
    return false;
  });
  REQUIRE(result.size() == 1);
  REQUIRE(result == expected);
}

TEST_CASE("tokenize with leading whitespace") {
  auto s = " hello world"sv;
  std::size_t count{};
  ns::tokenize(s.data(), s.data() + s.size(), [&](auto...) { return ++count; });
  CHECK(count == 2);
}

TEST_CASE("tokenize with trailing whitespace") {
  auto s = "hello world "sv;
  std::size_t count{};
  ns::tokenize(s.data(), s.data() + s.size(), [&](auto...) { return ++count; });
  CHECK(count == 2);
}

TEST_CASE("tokenize with no leading or trailing whitespace") {
  auto s = "hello world"sv;
  std::size_t count{};
  ns::tokenize(s.data(), s.data() + s.size(), [&](auto...) { return ++count; });
  CHECK(count == 2);
}

TEST_CASE("tokenize treats line endings and tabs as whitespace") {
  auto s = "SET\tkey  value\r\n"sv;
  std::vector<std::string> result;
  ns::tokenize(s.data(), s.data() + s.size(), [&](auto b, auto e) {
    result.emplace_back(b, e);
    return true;
  });
  CHECK(result == std::vector<std::string>{"SET", "key", "value"});
}

TEST_CASE("tokenize an empty range") {
  auto s = "  \r\n"sv;
  std::size_t count{};
  ns::tokenize(s.data(), s.data() + s.size(), [&](auto...) { return ++count; });
  CHECK(count == 0);
}
