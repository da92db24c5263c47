#ifndef VALKYRIE_IO_HPP
#define VALKYRIE_IO_HPP

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <streambuf>
#include <system_error>
#include <tuple>
#include <vector>

#include <sys/epoll.h>
#include <sys/mman.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace valkyrie::io {

/**
 * Call a posix style function under TEMP_FAILURE_RETRY and throw if there's an
 * error condition.
 * @tparam Function
 * @tparam Args
 * @param function
 * @param args
 * @return
 */
template <typename Function, typename... Args>
inline auto posix_call(Function function, Args... args)
    -> decltype(function(std::forward<Args>(args)...)) {
  using result_t = decltype(function(std::forward<Args>(args)...));
  result_t result{};
  TEMP_FAILURE_RETRY(result = function(std::forward<Args>(args)...));
  if (result == (result_t)-1)
    throw std::system_error(errno, std::generic_category());
  return result;
}

/**
 * RAII wrapper around a file descriptor that calls ::close() on destruction.
 */
class file_descriptor {
  friend void swap(file_descriptor &, file_descriptor &) noexcept;

public:
  file_descriptor() noexcept : value_(-1) {}

  template <typename Function, typename... Args>
  explicit file_descriptor(Function function, Args... args);

  file_descriptor(const file_descriptor &) = delete;
  file_descriptor &operator=(const file_descriptor &) = delete;
  file_descriptor(file_descriptor &&that) noexcept;
  file_descriptor &operator=(file_descriptor &&that) noexcept;

  int release() noexcept;
  void reset() noexcept;

  ~file_descriptor() noexcept;

  [[nodiscard]] int value() const noexcept;

  explicit operator bool() const noexcept { return value_ != -1; }

private:
  int value_;
};

void swap(file_descriptor &lhs, file_descriptor &rhs) noexcept;

/**
 * RAII wrapper around a memory mapping that calls ::munmap on destruction.
 */
class memory_map {
  friend void swap(memory_map &, memory_map &) noexcept;

public:
  template <typename... Args>
  memory_map(void *ptr, std::size_t len, Args... args);
  memory_map(const memory_map &) = delete;
  memory_map &operator=(const memory_map &) = delete;
  memory_map(memory_map &&) noexcept;
  memory_map &operator=(memory_map &&) noexcept;

  [[nodiscard]] std::tuple<void *, std::size_t> value() const noexcept;

  std::tuple<void *, std::size_t> release() noexcept;

  void reset() noexcept;

  ~memory_map() noexcept;

private:
  void *ptr_;
  std::size_t len_;
};

void swap(memory_map &lhs, memory_map &rhs) noexcept;

/**
 * A buffer of len bytes mapped twice back to back, so that len contiguous
 * bytes can be addressed from any offset.
 */
class ring_buffer {
public:
  explicit ring_buffer(std::size_t len);
  ring_buffer(const ring_buffer &) = delete;
  ring_buffer &operator=(const ring_buffer &) = delete;

  [[nodiscard]] char *addr(std::uint64_t i) const { return ptr_ + i % len_; }

  [[nodiscard]] std::size_t size() const { return len_; };

private:
  std::size_t len_;
  file_descriptor fd_;
  memory_map region_;
  char *const ptr_;
};

/**
 * A streambuf for outputting to a non-blocking file_descriptor. Syncing
 * writes whatever the descriptor accepts and never waits; the rest stays
 * pending until the next sync. Output is only written early when more than
 * limit bytes are pending, and if they still can't all be written, or a write
 * fails, the stream fails.
 */
class ofstreambuf : public std::streambuf {
public:
  ofstreambuf(file_descriptor fd, std::size_t limit);
  ofstreambuf(const ofstreambuf &) = delete;
  ofstreambuf &operator=(const ofstreambuf &) = delete;

  /**
   * @return bytes written into the stream that the descriptor hasn't taken
   */
  [[nodiscard]] std::size_t pending() const noexcept {
    return buf_.size() - read_index_;
  }

private:
  int sync() override;
  std::streamsize xsputn(const char_type *, std::streamsize) override;
  int overflow(int_type) override;

  file_descriptor fd_;
  std::vector<char> buf_;
  std::size_t read_index_;
  std::size_t limit_;
};

template <typename T>
void set_socket_option(int fd, int level, int opt_name, T opt_val) {
  posix_call(::setsockopt, fd, level, opt_name, &opt_val, sizeof(opt_val));
}

void epoll_add(int epollfd, int fd, decltype(::epoll_event::events) events,
               decltype(::epoll_event::data) data);

void epoll_del(int epollfd, int fd);

file_descriptor make_eventfd();

/**
 * Wake whoever is polling an eventfd. Safe from any thread.
 */
void signal_eventfd(int fd);

void drain_eventfd(int fd);

} // namespace valkyrie::io

template <typename Function, typename... Args>
valkyrie::io::file_descriptor::file_descriptor(Function function, Args... args)
    : value_(posix_call(function, std::forward<Args>(args)...)) {}

template <typename... Args>
valkyrie::io::memory_map::memory_map(void *ptr, std::size_t len, Args... args)
    : ptr_(posix_call(::mmap, ptr, len, args...)), len_(len) {}

#endif // VALKYRIE_IO_HPP
