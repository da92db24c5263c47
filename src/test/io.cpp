#include "catch2/catch_all.hpp"

#include <io.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

#include <poll.h>

namespace ns = valkyrie::io;
using namespace std::literals;

TEST_CASE("ring_buffer") {
  ns::ring_buffer rb(1 << 12);

  CHECK(*rb.addr(0) == *(rb.addr(0) + (1 << 12)));
  *rb.addr(0) += 1;
  CHECK(*rb.addr(0) == *(rb.addr(0) + (1 << 12)));
  *rb.addr(1 << 12) += 1;
  CHECK(*rb.addr(0) == *(rb.addr(0) + (1 << 12)));
}

TEST_CASE("ring_buffer wraps contiguously") {
  ns::ring_buffer rb(1 << 12);
  const auto s = "across the seam"sv;

  const std::uint64_t index = (1 << 12) - 4;
  std::copy(s.begin(), s.end(), rb.addr(index));

  CHECK(std::string_view(rb.addr(index), s.size()) == s);
  CHECK(std::string_view(rb.addr(0), s.size() - 4) == s.substr(4));
}

TEST_CASE("ring_buffer rejects a size that isn't whole pages") {
  CHECK_THROWS(ns::ring_buffer(100));
  CHECK_THROWS(ns::ring_buffer(0));
}

TEST_CASE("file_descriptor") {
  ns::file_descriptor fd(::memfd_create, "", 0);
  CHECK(fd);
  ns::file_descriptor other(std::move(fd));
  CHECK(!fd);
  CHECK(other);
  fd = std::move(other);
  CHECK(fd);
  fd.reset();
  CHECK(!fd);
}

struct ofstreambuf_fixture {
  ns::file_descriptor fd{::memfd_create, "", 0};
  const int sbfd = ::dup(fd.value());
  ns::ofstreambuf sb{ns::file_descriptor([this]() { return sbfd; }), 1 << 12};
  std::ostream os{&sb};
};

TEST_CASE_METHOD(ofstreambuf_fixture,
                 "output one string longer than the limit") {
  auto input = []() {
    std::array<char, 1 << 20> result{};
    std::mt19937 prng(42);
    std::uniform_int_distribution<unsigned char> dist(1, 255);
    std::generate_n(result.begin(), result.size() - 1,
                    [&]() { return dist(prng); });
    return result;
  }();

  decltype(input) output{};

  os << input.begin();
  os.flush();
  CHECK(os.good());

  ns::posix_call(::lseek, fd.value(), 0, SEEK_SET);
  ns::posix_call(::read, fd.value(), output.begin(), output.size());

  CHECK(input == output);
}

TEST_CASE_METHOD(ofstreambuf_fixture, "write an int") {
  os << 42;
  os.flush();
  CHECK(os.good());

  std::array<char, 1 << 10> output{};

  ns::posix_call(::lseek, fd.value(), 0, SEEK_SET);
  ns::posix_call(::read, fd.value(), output.begin(), output.size());

  CHECK("42"sv == output.begin());
}

TEST_CASE_METHOD(ofstreambuf_fixture, "failure to write marks stream bad") {
  ::close(sbfd);
  CHECK(os.good());
  os << 42;
  os.flush();
  CHECK(os.bad());
  CHECK(!os.good());
}

namespace {

std::array<ns::file_descriptor, 2> nonblocking_socket_pair() {
  std::array<int, 2> fds{};
  ns::posix_call(::socketpair, AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0,
                 fds.data());
  return {ns::file_descriptor([&]() { return fds[0]; }),
          ns::file_descriptor([&]() { return fds[1]; })};
}

} // namespace

TEST_CASE("ofstreambuf keeps what a full socket won't take") {
  auto [writer_fd, reader_fd] = nonblocking_socket_pair();

  const std::string input(4 << 20, 'x');
  std::string output;

  ns::ofstreambuf sb(std::move(writer_fd), 16 << 20);
  std::ostream os(&sb);
  os << input;
  os.flush();
  CHECK(os.good());
  CHECK(sb.pending() > 0);
  CHECK(sb.pending() < input.size());

  // drain the peer and flush again until everything has arrived
  std::array<char, 1 << 16> buf{};
  for (int i = 0; i < 10000 && output.size() < input.size(); ++i) {
    const auto n = ::read(reader_fd.value(), buf.data(), buf.size());
    if (n > 0)
      output.append(buf.data(), n);
    os.flush();
    REQUIRE(os.good());
  }

  CHECK(sb.pending() == 0);
  CHECK(output == input);
}

TEST_CASE("ofstreambuf fails once a peer that never reads is over the limit") {
  auto [writer_fd, reader_fd] = nonblocking_socket_pair();

  ns::ofstreambuf sb(std::move(writer_fd), 1 << 16);
  std::ostream os(&sb);

  const auto start = std::chrono::steady_clock::now();
  os << std::string(16 << 20, 'x');
  os.flush();
  CHECK(os.bad());
  // it never waits for the peer
  CHECK(std::chrono::steady_clock::now() - start < 1s);
}

TEST_CASE("ofstreambuf holds small writes until synced") {
  auto [writer_fd, reader_fd] = nonblocking_socket_pair();

  ns::ofstreambuf sb(std::move(writer_fd), 1 << 16);
  std::ostream os(&sb);

  os << "+PONG\r\n";
  CHECK(sb.pending() == 7);

  std::array<char, 16> buf{};
  CHECK(::read(reader_fd.value(), buf.data(), buf.size()) == -1);

  os.flush();
  CHECK(sb.pending() == 0);
  CHECK(::read(reader_fd.value(), buf.data(), buf.size()) == 7);
  CHECK(std::string_view(buf.data(), 7) == "+PONG\r\n");
}

TEST_CASE("eventfd") {
  auto fd = ns::make_eventfd();

  const auto readable = [&fd]() {
    ::pollfd pfd{.fd = fd.value(), .events = POLLIN, .revents = 0};
    return ::poll(&pfd, 1, 0) == 1;
  };

  CHECK(!readable());
  ns::signal_eventfd(fd.value());
  ns::signal_eventfd(fd.value());
  CHECK(readable());
  ns::drain_eventfd(fd.value());
  CHECK(!readable());
  CHECK_NOTHROW(ns::drain_eventfd(fd.value()));
}
