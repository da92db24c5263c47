#include "resp.hpp"
#include "util.hpp"

#include <algorithm>
#include <charconv>
#include <string>

namespace {

namespace ns = valkyrie::resp;
using ns::resp_error;

constexpr std::string_view crlf = "\r\n";
constexpr char cr = '\r';
constexpr char lf = '\n';

inline void end(std::ostream &os_) { os_ << crlf; }

const char *parse_value(const char *begin, const char *end, ns::handler &h,
                        int depth);

/**
 * Find the CR of the CRLF terminating the line starting at begin.
 * @return the CR, or nullptr if the terminator hasn't arrived yet
 */
const char *find_line_end(const char *begin, const char *end) {
  const auto pos = std::find(begin, end, cr);
  if (end - pos < 2)
    return nullptr;
  if (pos[1] != lf)
    throw resp_error("carriage return without newline");
  return pos;
}

/**
 * Parse the length field of a '$' or '*' header. A header that hasn't been
 * terminated yet is still checked so that garbage is rejected early.
 */
const char *parse_length(const char *begin, const char *end,
                         std::int64_t &length, std::int64_t max,
                         const char *what) {
  const auto invalid = [what]() {
    return resp_error(std::string("invalid ") + what + " length");
  };

  const auto pos = std::find(begin, end, cr);

  if (std::any_of(begin, pos, [](char c) {
        return c != '-' && (c < '0' || c > '9');
      })) {
    throw invalid();
  }

  const auto line_end = find_line_end(begin, end);
  if (!line_end)
    return nullptr;

  auto [ptr, ec] = std::from_chars(begin, line_end, length);
  if (begin == line_end || ec != std::errc() || ptr != line_end)
    throw invalid();
  if (length < -1 || length > max)
    throw invalid();

  return line_end + crlf.size();
}

const char *parse_line(const char *begin, const char *end, ns::handler &h,
                       void (ns::handler::*begin_callback)(),
                       void (ns::handler::*end_callback)()) {
  const auto pos = find_line_end(begin, end);
  if (!pos)
    return nullptr;
  (h.*begin_callback)();
  h.chars(begin, pos);
  (h.*end_callback)();
  return pos + crlf.size();
}

const char *parse_integer(const char *begin, const char *end,
                          ns::handler &h) {
  const auto pos = find_line_end(begin, end);
  if (!pos)
    return nullptr;
  std::int64_t value{};
  auto [ptr, ec] = std::from_chars(begin, pos, value);
  if (begin == pos || ec != std::errc() || ptr != pos)
    throw resp_error("invalid integer");
  h.begin_integer();
  h.chars(begin, pos);
  h.end_integer();
  return pos + crlf.size();
}

const char *parse_bulk_string(const char *begin, const char *end,
                              ns::handler &h) {
  std::int64_t length{};
  const auto body = parse_length(begin, end, length, ns::max_bulk_length,
                                 "bulk");
  if (!body)
    return nullptr;

  if (length == -1) {
    h.begin_bulk_string(-1);
    h.end_bulk_string();
    return body;
  }

  if (end - body < length + std::int64_t(crlf.size()))
    return nullptr;

  const auto body_end = body + length;
  if (body_end[0] != cr || body_end[1] != lf)
    throw resp_error("bulk string not terminated by CRLF");

  h.begin_bulk_string(length);
  h.chars(body, body_end);
  h.end_bulk_string();
  return body_end + crlf.size();
}

const char *parse_array(const char *begin, const char *end, ns::handler &h,
                        int depth) {
  if (depth >= ns::max_depth)
    throw resp_error("nesting too deep");

  std::int64_t length{};
  auto pos = parse_length(begin, end, length, ns::max_array_length,
                          "multibulk");
  if (!pos)
    return nullptr;

  h.begin_array(length);
  for (std::int64_t i = 0; i < length; ++i) {
    pos = parse_value(pos, end, h, depth + 1);
    if (!pos)
      return nullptr;
  }
  h.end_array();
  return pos;
}

/**
 * An inline command is a whitespace separated line terminated by LF, with or
 * without a preceding CR.
 */
const char *parse_inline(const char *begin, const char *end, ns::handler &h) {
  const auto pos = std::find(begin, end, lf);
  if (pos == end) {
    if (std::size_t(end - begin) > ns::max_inline_length)
      throw resp_error("too big inline request");
    return nullptr;
  }

  std::int64_t len{};
  valkyrie::util::tokenize(begin, pos, [&](auto...) { return ++len; });
  h.begin_array(len);
  valkyrie::util::tokenize(begin, pos, [&](auto token_begin, auto token_end) {
    h.begin_bulk_string(token_end - token_begin);
    h.chars(token_begin, token_end);
    h.end_bulk_string();
    return true;
  });
  h.end_array();
  return pos + 1;
}

const char *parse_value(const char *begin, const char *end, ns::handler &h,
                        int depth) {
  if (begin == end)
    return nullptr;

  switch (*begin) {
  case '+':
    return parse_line(begin + 1, end, h, &ns::handler::begin_simple_string,
                      &ns::handler::end_simple_string);
  case '-':
    return parse_line(begin + 1, end, h, &ns::handler::begin_error,
                      &ns::handler::end_error);
  case ':':
    return parse_integer(begin + 1, end, h);
  case '$':
    return parse_bulk_string(begin + 1, end, h);
  case '*':
    return parse_array(begin + 1, end, h, depth);
  default:
    if (depth > 0)
      throw resp_error(std::string("unexpected type byte '") + *begin + "'");
    return parse_inline(begin, end, h);
  }
}

} // namespace

void ns::writer::begin_simple_string() { os_ << '+'; }

void ns::writer::end_simple_string() { end(os_); }

void ns::writer::begin_error() { os_ << '-'; }

void ns::writer::end_error() { end(os_); }

void ns::writer::begin_integer() { os_ << ':'; }

void ns::writer::end_integer() { end(os_); }

void ns::writer::begin_bulk_string(std::int64_t len) {
  os_ << '$' << len;
  if (len != -1)
    os_ << crlf;
}

void ns::writer::end_bulk_string() { end(os_); }

void ns::writer::begin_array(std::int64_t len) { os_ << '*' << len << crlf; }

void ns::writer::end_array() {}

void ns::writer::chars(const char *begin, const char *end) {
  os_.write(begin, end - begin);
}

ns::writer::writer(std::ostream &os) : os_(os) {}

std::tuple<ns::decode_status, const char *>
ns::decode(const char *begin, const char *end, handler &output) {
  // a first pass proves the message is complete so that output never sees a
  // partial message
  null_handler validator;
  const auto next = parse_value(begin, end, validator, 0);
  if (!next)
    return {decode_status::incomplete, begin};

  parse_value(begin, end, output, 0);
  return {decode_status::complete, next};
}

void ns::simple_string(handler &output, std::string_view value) {
  output.begin_simple_string();
  output.chars(value.data(), value.data() + value.size());
  output.end_simple_string();
}

void ns::error(handler &output, std::string_view msg) {
  // the message may quote client bytes, and a line break would end the frame
  std::string line(msg);
  std::replace_if(
      line.begin(), line.end(), [](char c) { return c == cr || c == lf; },
      ' ');
  output.begin_error();
  output.chars(line.data(), line.data() + line.size());
  output.end_error();
}

void ns::bulk_string(handler &output, std::string_view value) {
  output.begin_bulk_string(std::int64_t(value.size()));
  output.chars(value.data(), value.data() + value.size());
  output.end_bulk_string();
}

void ns::nil_string(handler &output) {
  output.begin_bulk_string(-1);
  output.end_bulk_string();
}

void ns::nil_array(handler &output) {
  output.begin_array(-1);
  output.end_array();
}
