#ifndef VALKYRIE_RESP_HPP
#define VALKYRIE_RESP_HPP

#include <array>
#include <charconv>
#include <cstdint>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <tuple>

namespace valkyrie::resp {

/**
 * Malformed framing. The connection that produced it can't be resynchronised.
 */
class resp_error : public std::runtime_error {
public:
  using runtime_error::runtime_error;
};

constexpr std::int64_t max_bulk_length = 512LL * 1024 * 1024;
constexpr std::int64_t max_array_length = 1024 * 1024;
constexpr std::size_t max_inline_length = 64 * 1024;
constexpr int max_depth = 32;

/**
 * Receives a RESP value as a sequence of events. Decoding replays a message
 * into a handler and encoding is a handler that writes bytes.
 */
class handler {
public:
  virtual void begin_simple_string() = 0;

  virtual void end_simple_string() = 0;

  virtual void begin_error() = 0;

  virtual void end_error() = 0;

  virtual void begin_integer() = 0;

  virtual void end_integer() = 0;

  virtual void begin_bulk_string(std::int64_t len) = 0;

  virtual void end_bulk_string() = 0;

  virtual void begin_array(std::int64_t len) = 0;

  virtual void end_array() = 0;

  virtual void chars(const char *begin, const char *end) = 0;

  handler() = default;

  virtual ~handler() = default;
};

class null_handler : public handler {
public:
  void begin_simple_string() override {}
  void end_simple_string() override {}
  void begin_error() override {}
  void end_error() override {}
  void begin_integer() override {}
  void end_integer() override {}
  void begin_bulk_string(std::int64_t) override {}
  void end_bulk_string() override {}
  void begin_array(std::int64_t) override {}
  void end_array() override {}
  void chars(const char *, const char *) override {}
};

/**
 * Encodes events as RESP onto an ostream.
 */
class writer : public handler {

public:
  void begin_simple_string() override;

  void end_simple_string() override;

  void begin_error() override;

  void end_error() override;

  void begin_integer() override;

  void end_integer() override;

  void begin_bulk_string(std::int64_t len) override;

  void end_bulk_string() override;

  void begin_array(std::int64_t len) override;

  void end_array() override;

  void chars(const char *begin, const char *end) override;

  explicit writer(std::ostream &os);
  writer(const writer &) = delete;
  writer &operator=(const writer &) = delete;

  ~writer() override = default;

private:
  std::ostream &os_;
};

enum class decode_status { complete, incomplete };

/**
 * Decode exactly one message from the front of [begin, end).
 *
 * If the whole message is present its events are replayed into output and the
 * result is {complete, end of message}. Otherwise nothing is emitted and the
 * result is {incomplete, begin}; call again once more bytes have arrived.
 *
 * A line that doesn't start with a RESP type byte is an inline command and is
 * reported as an array of bulk strings.
 *
 * @throws resp_error if the bytes can't be RESP
 */
std::tuple<decode_status, const char *> decode(const char *begin,
                                               const char *end,
                                               handler &output);

template <typename Integer> auto to_chars(Integer i) {
  std::tuple<std::array<char, std::numeric_limits<Integer>::digits10 + 2>,
             std::size_t>
      result;
  auto &[buf, len] = result;
  auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), i);
  if (ec != std::errc())
    throw std::logic_error("can't render an integer");
  len = ptr - buf.data();
  return result;
}

void simple_string(handler &output, std::string_view value);

/**
 * Write msg as a simple error. CR and LF are replaced with spaces so that the
 * reply stays a single line.
 */
void error(handler &output, std::string_view msg);

void bulk_string(handler &output, std::string_view value);

void nil_string(handler &output);

void nil_array(handler &output);

template <typename Integer> void integer(handler &output, Integer i) {
  auto [buf, len] = to_chars(i);
  output.begin_integer();
  output.chars(buf.data(), buf.data() + len);
  output.end_integer();
}

} // namespace valkyrie::resp

#endif // VALKYRIE_RESP_HPP
