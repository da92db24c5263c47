#include "event_loop.hpp"
#include "log.hpp"

#include <algorithm>
#include <array>
#include <climits>
#include <span>

#include <sys/epoll.h>

valkyrie::loop_waiter::loop_waiter(event_loop &loop, connection &owner)
    : loop_(loop), owner_(&owner) {}

void valkyrie::loop_waiter::notify() {
  try {
    loop_.wake(shared_from_this());
  } catch (const std::exception &e) {
    log::error("can't wake event loop {}: {}", loop_.id(), e.what());
  }
}

template <typename Function>
void valkyrie::event_loop::guarded(int fd, Function function) {
  try {
    function();
  } catch (const peer_closed &) {
    close(fd);
  } catch (const resp::resp_error &e) {
    log::warn("protocol error on connection {}: {}", fd, e.what());
    close(fd);
  } catch (const std::exception &e) {
    log::warn("closing connection {}: {}", fd, e.what());
    close(fd);
  }
}

valkyrie::event_loop::event_loop(std::size_t id, engine &db,
                                 std::size_t input_buffer_bytes)
    : id_(id), db_(db), input_buffer_bytes_(input_buffer_bytes),
      epoll_(::epoll_create1, EPOLL_CLOEXEC), wakeup_(io::make_eventfd()) {
  io::epoll_add(epoll_.value(), wakeup_.value(), EPOLLIN,
                {.fd = wakeup_.value()});
}

valkyrie::event_loop::~event_loop() = default;

void valkyrie::event_loop::listen(io::file_descriptor listener) {
  io::epoll_add(epoll_.value(), listener.value(), EPOLLIN,
                {.fd = listener.value()});
  listener_ = std::move(listener);
}

void valkyrie::event_loop::deal_to(std::vector<event_loop *> loops) {
  peers_ = std::move(loops);
}

void valkyrie::event_loop::run(std::stop_token stop) {
  log::set_thread_name("event-loop-" + std::to_string(id_));

  std::stop_callback on_stop(stop, [this]() { interrupt(); });

  std::array<::epoll_event, 128> events{};

  while (!stop.stop_requested()) {
    int n{};
    TEMP_FAILURE_RETRY(n = ::epoll_wait(epoll_.value(), events.data(),
                                        int(events.size()), next_timeout()));
    if (n == -1)
      throw std::system_error(errno, std::generic_category());

    for (const auto &event : std::span(events.data(), std::size_t(n)))
      on_event(event);

    // notifications first, so a push that beat the deadline still wins
    on_mailbox();
    on_timers();
  }

  connections_.clear();
  log::debug("stopped");
}

void valkyrie::event_loop::adopt(io::file_descriptor fd) {
  {
    std::lock_guard lock(mailbox_mutex_);
    adopted_.push_back(std::move(fd));
  }
  io::signal_eventfd(wakeup_.value());
}

void valkyrie::event_loop::wake(std::shared_ptr<loop_waiter> w) {
  {
    std::lock_guard lock(mailbox_mutex_);
    woken_.push_back(std::move(w));
  }
  io::signal_eventfd(wakeup_.value());
}

void valkyrie::event_loop::add_timer(clock::time_point deadline, int fd) {
  timers_.emplace(deadline, fd);
}

void valkyrie::event_loop::cancel_timer(clock::time_point deadline,
                                        int fd) noexcept {
  timers_.erase(std::make_tuple(deadline, fd));
}

void valkyrie::event_loop::interrupt() noexcept {
  try {
    io::signal_eventfd(wakeup_.value());
  } catch (const std::system_error &e) {
    log::error("can't interrupt event loop {}: {}", id_, e.what());
  }
}

void valkyrie::event_loop::on_event(const ::epoll_event &event) {
  const int fd = event.data.fd;

  if (fd == wakeup_.value()) {
    io::drain_eventfd(fd);
    return;
  }

  if (listener_ && fd == listener_.value()) {
    on_accept();
    return;
  }

  const auto pos = connections_.find(fd);
  if (pos == connections_.end())
    return;

  auto &conn = *pos->second;

  // a blocked connection isn't reading, so a hang up must cancel its wait
  if ((event.events & (EPOLLHUP | EPOLLERR)) ||
      (conn.blocked() && (event.events & EPOLLRDHUP))) {
    log::debug("connection {} hung up", fd);
    close(fd);
    return;
  }

  if (event.events & (EPOLLIN | EPOLLRDHUP))
    guarded(fd, [&conn]() { conn.on_readable(); });
  else if (event.events & EPOLLOUT)
    guarded(fd, [&conn]() { conn.on_writable(); });
}

void valkyrie::event_loop::on_accept() {
  for (;;) {
    io::file_descriptor fd;

    try {
      fd = io::file_descriptor(::accept4, listener_.value(), nullptr, nullptr,
                               SOCK_NONBLOCK | SOCK_CLOEXEC);
    } catch (const std::system_error &e) {
      if (e.code() == std::errc::resource_unavailable_try_again ||
          e.code() == std::errc::operation_would_block)
        return;
      if (e.code() == std::errc::connection_aborted)
        continue;
      // e.g. out of descriptors, the listener stays readable so retry later
      log::warn("accept failed: {}", e.what());
      return;
    }

    if (peers_.empty()) {
      add_connection(std::move(fd));
    } else {
      auto *target = peers_[next_peer_++ % peers_.size()];
      if (target == this)
        add_connection(std::move(fd));
      else
        target->adopt(std::move(fd));
    }
  }
}

void valkyrie::event_loop::on_mailbox() {
  std::vector<std::shared_ptr<loop_waiter>> woken;
  std::vector<io::file_descriptor> adopted;
  {
    std::lock_guard lock(mailbox_mutex_);
    woken.swap(woken_);
    adopted.swap(adopted_);
  }

  for (auto &fd : adopted)
    add_connection(std::move(fd));

  // a detached waiter belongs to a pop that has finished or a connection
  // that has gone
  for (const auto &w : woken) {
    if (auto conn = w->owner())
      guarded(conn->fd(), [conn]() { conn->on_wakeup(); });
  }
}

void valkyrie::event_loop::on_timers() {
  const auto now = clock::now();

  while (!timers_.empty()) {
    const auto [deadline, fd] = *timers_.begin();
    if (deadline > now)
      break;
    timers_.erase(timers_.begin());

    if (const auto pos = connections_.find(fd); pos != connections_.end()) {
      auto &conn = *pos->second;
      guarded(fd, [&conn]() { conn.on_timeout(); });
    }
  }
}

void valkyrie::event_loop::add_connection(io::file_descriptor fd) {
  const int value = fd.value();

  try {
    auto conn =
        std::make_unique<connection>(std::move(fd), db_, *this,
                                     input_buffer_bytes_);
    io::epoll_add(epoll_.value(), value,
                  EPOLLIN | EPOLLOUT | EPOLLRDHUP | EPOLLET, {.fd = value});
    connections_.emplace(value, std::move(conn));
  } catch (const std::system_error &e) {
    log::warn("dropping connection {}: {}", value, e.what());
    return;
  }

  log::debug("connection {} opened", value);
}

void valkyrie::event_loop::close(int fd) {
  io::epoll_del(epoll_.value(), fd);
  connections_.erase(fd);
  log::debug("connection {} closed", fd);
}

int valkyrie::event_loop::next_timeout() const {
  if (timers_.empty())
    return -1;

  const auto remaining = std::get<0>(*timers_.begin()) - clock::now();
  if (remaining <= clock::duration::zero())
    return 0;

  const auto ms =
      std::chrono::ceil<std::chrono::milliseconds>(remaining).count();
  return int(std::min<std::int64_t>(ms, INT_MAX));
}
