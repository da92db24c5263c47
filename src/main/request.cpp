#include "request.hpp"
#include "util.hpp"

#include <numeric>

namespace {
using valkyrie::resp::resp_error;
} // namespace

void valkyrie::request_builder::begin_simple_string() { begin_line(); }

void valkyrie::request_builder::end_simple_string() { end_line(); }

void valkyrie::request_builder::begin_error() { begin_line(); }

void valkyrie::request_builder::end_error() { end_line(); }

void valkyrie::request_builder::begin_integer() { begin_line(); }

void valkyrie::request_builder::end_integer() { end_line(); }

void valkyrie::request_builder::begin_array(std::int64_t len) {
  if (depth_ > 0)
    throw resp_error("nested array in request");
  clear(len);
  ++depth_;
}

void valkyrie::request_builder::end_array() {
  --depth_;
  finish();
}

void valkyrie::request_builder::begin_bulk_string(std::int64_t len) {
  if (len == -1)
    throw resp_error("null bulk string in request");
  if (depth_ == 0)
    clear(1);
  buf_.reserve(buf_.size() + len);
}

void valkyrie::request_builder::end_bulk_string() {
  ends_.push_back(buf_.size());
  if (depth_ == 0)
    finish();
}

void valkyrie::request_builder::chars(const char *begin, const char *end) {
  buf_.append(begin, end);
}

void valkyrie::request_builder::begin_line() {
  if (depth_ > 0)
    throw resp_error("expected bulk string in request");
  clear(0);
}

void valkyrie::request_builder::end_line() {
  util::tokenize(buf_.data(), buf_.data() + buf_.size(),
                 [this](auto begin, auto end) {
                   args_.emplace_back(begin, end - begin);
                   return true;
                 });
}

void valkyrie::request_builder::clear(std::int64_t len) {
  buf_.clear();
  args_.clear();
  ends_.clear();
  if (len > 0) {
    args_.reserve(len);
    ends_.reserve(len);
  }
}

void valkyrie::request_builder::finish() {
  std::accumulate(ends_.begin(), ends_.end(), std::size_t(0),
                  [this](auto begin, auto end) {
                    args_.emplace_back(buf_.data() + begin, end - begin);
                    return end;
                  });
}
