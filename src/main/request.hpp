#ifndef VALKYRIE_REQUEST_HPP
#define VALKYRIE_REQUEST_HPP

#include "resp.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace valkyrie {

using args_t = std::vector<std::string_view>;

/**
 * Collects a decoded client request into one contiguous buffer. A request is
 * an array of bulk strings, a top-level bulk string, or a line (inline
 * commands and bare simple strings such as "+PING") split on whitespace.
 *
 * args() refers into the builder and is valid until the next request starts.
 */
class request_builder : public resp::handler {
public:
  request_builder() = default;

  request_builder(const request_builder &) = delete;
  request_builder &operator=(const request_builder &) = delete;

  [[nodiscard]] const args_t &args() const noexcept { return args_; }

private:
  void begin_simple_string() override;
  void end_simple_string() override;
  void begin_error() override;
  void end_error() override;
  void begin_integer() override;
  void end_integer() override;
  void begin_array(std::int64_t len) override;
  void end_array() override;
  void begin_bulk_string(std::int64_t len) override;
  void end_bulk_string() override;
  void chars(const char *begin, const char *end) override;

  void begin_line();
  void end_line();
  void clear(std::int64_t len);
  void finish();

  std::string buf_;
  std::vector<std::size_t> ends_;
  args_t args_;
  int depth_{};
};

} // namespace valkyrie

#endif // VALKYRIE_REQUEST_HPP
