#include "io.hpp"

#include <algorithm>
#include <cassert>
#include <utility>

#include <sys/eventfd.h>

namespace ns = valkyrie::io;

ns::file_descriptor::file_descriptor(file_descriptor &&that) noexcept
    : value_(-1) {
  swap(*this, that);
}

ns::file_descriptor &
ns::file_descriptor::operator=(file_descriptor &&that) noexcept {
  reset();
  swap(*this, that);
  return *this;
}

int ns::file_descriptor::release() noexcept {
  return std::exchange(value_, -1);
}

void ns::file_descriptor::reset() noexcept {
  if (auto released = release(); released != -1)
    ::close(released);
}

ns::file_descriptor::~file_descriptor() noexcept { reset(); }

int ns::file_descriptor::value() const noexcept { return value_; }

void ns::swap(ns::file_descriptor &lhs, ns::file_descriptor &rhs) noexcept {
  using std::swap;
  swap(lhs.value_, rhs.value_);
}

ns::memory_map::memory_map(memory_map &&that) noexcept : ptr_(), len_() {
  swap(*this, that);
}

ns::memory_map &ns::memory_map::operator=(memory_map &&that) noexcept {
  reset();
  swap(*this, that);
  return *this;
}

std::tuple<void *, std::size_t> ns::memory_map::value() const noexcept {
  return std::make_tuple(ptr_, len_);
}

std::tuple<void *, std::size_t> ns::memory_map::release() noexcept {
  auto result = value();
  ptr_ = nullptr;
  len_ = 0;
  return result;
}

void ns::memory_map::reset() noexcept {
  auto [ptr, len] = release();
  if (ptr)
    ::munmap(ptr, len);
}

ns::memory_map::~memory_map() noexcept { reset(); }

void ns::swap(memory_map &lhs, memory_map &rhs) noexcept {
  using std::swap;
  swap(lhs.ptr_, rhs.ptr_);
  swap(lhs.len_, rhs.len_);
}

namespace {

std::size_t validated_len(std::size_t len) {
  if (!len || len % sysconf(_SC_PAGESIZE) != 0)
    throw std::runtime_error("bad size");
  return len;
}

ns::file_descriptor make_memfd(std::size_t len) {
  ns::file_descriptor result(::memfd_create, "valkyrie::io::ring_buffer", 0);
  ns::posix_call(::ftruncate, result.value(), len);
  return result;
}

ns::memory_map make_region(const ns::file_descriptor &fd, std::size_t len) {
  return {nullptr, 2 * len, PROT_READ | PROT_WRITE, MAP_SHARED, fd.value(), 0};
}

} // namespace

/**
 * Map a region in memory twice the length of the buffer then remap the second
 * half to mirror the first half.
 * @param len
 */
ns::ring_buffer::ring_buffer(std::size_t len)
    : len_(validated_len(len)), fd_(make_memfd(len_)),
      region_(make_region(fd_, len_)),
      ptr_(static_cast<char *>(std::get<0>(region_.value()))) {
  posix_call(::mmap, ptr_ + len_, len_, PROT_READ | PROT_WRITE,
             MAP_SHARED | MAP_FIXED, fd_.value(), 0);
}

ns::ofstreambuf::ofstreambuf(file_descriptor fd, std::size_t limit)
    : fd_(std::move(fd)), read_index_(), limit_(limit) {}

int ns::ofstreambuf::sync() {
  while (pending()) {
    ssize_t result{};
    TEMP_FAILURE_RETRY(result = ::write(fd_.value(), buf_.data() + read_index_,
                                        pending()));
    if (result > 0)
      read_index_ += result;
    else if (result == -1 && (errno == EAGAIN || errno == EWOULDBLOCK))
      break;
    else
      return EOF;
  }

  if (!pending()) {
    buf_.clear();
    read_index_ = 0;
  } else if (read_index_ > buf_.size() / 2) {
    buf_.erase(buf_.begin(), buf_.begin() + std::ptrdiff_t(read_index_));
    read_index_ = 0;
  }
  return 0;
}

std::streamsize ns::ofstreambuf::xsputn(const char_type *s,
                                        const std::streamsize n) {
  assert(n >= 0);
  buf_.insert(buf_.end(), s, s + n);
  if (pending() > limit_ && (sync() == EOF || pending() > limit_))
    return 0;
  return n;
}

int ns::ofstreambuf::overflow(int_type ch) {
  if (ch != EOF) {
    auto c = static_cast<char>(static_cast<unsigned char>(ch));
    return xsputn(&c, 1) == 1 ? 0 : EOF;
  }
  return 0;
}

void ns::epoll_add(int epollfd, int fd, decltype(::epoll_event::events) events,
                   decltype(::epoll_event::data) data) {
  ::epoll_event ev{};
  ev.events = events;
  ev.data = data;
  posix_call(::epoll_ctl, epollfd, EPOLL_CTL_ADD, fd, &ev);
}

void ns::epoll_del(int epollfd, int fd) {
  ::epoll_event ev{};
  posix_call(::epoll_ctl, epollfd, EPOLL_CTL_DEL, fd, &ev);
}

ns::file_descriptor ns::make_eventfd() {
  return file_descriptor(::eventfd, 0u, EFD_NONBLOCK | EFD_CLOEXEC);
}

void ns::signal_eventfd(int fd) {
  const std::uint64_t one = 1;
  ssize_t result{};
  TEMP_FAILURE_RETRY(result = ::write(fd, &one, sizeof(one)));
  // EAGAIN means the counter is saturated, which already wakes the reader
  if (result == -1 && errno != EAGAIN)
    throw std::system_error(errno, std::generic_category());
}

void ns::drain_eventfd(int fd) {
  std::uint64_t count{};
  ssize_t result{};
  TEMP_FAILURE_RETRY(result = ::read(fd, &count, sizeof(count)));
  if (result == -1 && errno != EAGAIN)
    throw std::system_error(errno, std::generic_category());
}
