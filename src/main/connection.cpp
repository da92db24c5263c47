#include "connection.hpp"
#include "event_loop.hpp"
#include "util.hpp"

#include <netinet/in.h>
#include <netinet/tcp.h>

namespace {

// stop decoding requests once this much output is waiting for the peer
constexpr std::size_t output_watermark = 1 << 16;

// a peer that leaves this much unread is dropped
constexpr std::size_t output_limit = 64 << 20;

} // namespace

valkyrie::connection::connection(io::file_descriptor fd, engine &db,
                                 event_loop &loop,
                                 std::size_t input_buffer_bytes)
    : fd_(std::move(fd)), db_(db), loop_(loop), in_(input_buffer_bytes),
      out_buf_(io::file_descriptor(::dup, fd_.value()), output_limit) {
  io::set_socket_option(fd_.value(), SOL_SOCKET, SO_SNDBUF, 1 << 20);
  io::set_socket_option(fd_.value(), IPPROTO_TCP, TCP_NODELAY, 1);
}

valkyrie::connection::~connection() { finish_wait(); }

void valkyrie::connection::on_readable() {
  try {
    process();

    while (state_ == state::reading && !congested()) {
      const auto len = in_.size() - (write_index_ - read_index_);

      // process() consumed every complete request, so what's left is a
      // prefix of one that can never fit
      if (len == 0)
        throw resp::resp_error("request exceeds the input buffer");

      const auto n = ::read(fd_.value(), in_.addr(write_index_), len);

      if (n == -1) {
        if (errno == EINTR)
          continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
          break;
        throw std::system_error(errno, std::generic_category());
      }

      if (n == 0) {
        flush();
        throw peer_closed("peer closed the connection");
      }

      write_index_ += n;
      process();
    }
  } catch (const resp::resp_error &e) {
    resp::error(writer_, std::string("ERR Protocol error: ") + e.what());
    out_.flush();
    throw;
  }

  flush();
}

void valkyrie::connection::on_writable() {
  flush();
  // input left unread while congested won't be signalled again
  if (state_ == state::reading && !congested())
    on_readable();
}

void valkyrie::connection::on_wakeup() {
  if (state_ == state::blocked && try_complete())
    on_readable();
}

void valkyrie::connection::on_timeout() {
  if (state_ != state::blocked)
    return;
  finish_wait();
  commands::reply_popped(writer_, std::nullopt);
  on_readable();
}

void valkyrie::connection::process() {
  while (state_ == state::reading && write_index_ != read_index_ &&
         !congested()) {
    const char *const begin = in_.addr(read_index_);
    const char *const end = begin + (write_index_ - read_index_);

    const auto [status, next] = resp::decode(begin, end, request_);
    if (status == resp::decode_status::incomplete)
      return;

    read_index_ += next - begin;
    execute(request_.args());
  }
}

void valkyrie::connection::execute(const args_t &args) {
  auto outcome = commands::dispatch(args, db_, writer_);

  std::visit(util::overloaded{
                 [](std::monostate) {},
                 [this](commands::blocking_pop &pop) { block(std::move(pop)); },
             },
             outcome);

  if (out_.bad())
    throw std::runtime_error("slow consumer");
}

void valkyrie::connection::block(commands::blocking_pop pop) {
  keys_ = std::move(pop.keys);
  key_views_.assign(keys_.begin(), keys_.end());

  waiter_ = std::make_shared<loop_waiter>(loop_, *this);
  registration_ = db_.watch(key_views_, waiter_);
  state_ = state::blocked;

  // a push between dispatch's attempt and registration wouldn't have
  // notified us
  if (try_complete())
    return;

  if (pop.timeout != engine::duration::zero()) {
    deadline_ = std::chrono::steady_clock::now() + pop.timeout;
    loop_.add_timer(*deadline_, fd());
  }
}

/**
 * Re-run the fast path in the original key order. On success the wait is
 * over and the reply has been written.
 */
bool valkyrie::connection::try_complete() {
  std::optional<engine::popped_t> popped;

  try {
    popped = db_.try_pop_first(key_views_);
  } catch (const wrong_type &e) {
    finish_wait();
    resp::error(writer_, e.what());
    return true;
  }

  if (!popped)
    return false;

  finish_wait();
  commands::reply_popped(writer_, popped);
  return true;
}

void valkyrie::connection::finish_wait() noexcept {
  registration_.release();
  if (waiter_) {
    waiter_->detach();
    waiter_.reset();
  }
  if (deadline_) {
    loop_.cancel_timer(*deadline_, fd());
    deadline_.reset();
  }
  key_views_.clear();
  keys_.clear();
  state_ = state::reading;
}

bool valkyrie::connection::congested() {
  if (out_buf_.pending() < output_watermark)
    return false;
  flush();
  return out_buf_.pending() >= output_watermark;
}

void valkyrie::connection::flush() {
  out_.flush();
  if (out_.bad())
    throw std::runtime_error("slow consumer");
}
