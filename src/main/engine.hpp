#ifndef VALKYRIE_ENGINE_HPP
#define VALKYRIE_ENGINE_HPP

#include "shard.hpp"
#include "waiter.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace valkyrie {

/**
 * The keyspace, partitioned into a fixed number of shards by a hash of the
 * key. Every operation locks exactly one shard.
 */
class engine {
public:
  using keys_t = std::span<const std::string_view>;
  using values_t = shard::values_t;
  using popped_t = std::tuple<std::string, std::string>;
  using duration = std::chrono::steady_clock::duration;

  /**
   * Keeps a waiter registered on a set of keys. Releasing deregisters it from
   * every shard; release() may be called any number of times and the
   * destructor calls it too.
   */
  class registration {
    friend class engine;

  public:
    registration() = default;
    registration(const registration &) = delete;
    registration &operator=(const registration &) = delete;
    registration(registration &&that) noexcept;
    registration &operator=(registration &&that) noexcept;

    ~registration();

    void release() noexcept;

    [[nodiscard]] bool active() const noexcept { return engine_ != nullptr; }

  private:
    registration(engine &e, keys_t keys, std::shared_ptr<waiter> w);

    engine *engine_{};
    std::vector<std::string> keys_;
    std::shared_ptr<waiter> waiter_;
  };

  explicit engine(std::size_t shard_count);

  engine(const engine &) = delete;
  engine &operator=(const engine &) = delete;

  [[nodiscard]] std::size_t shard_count() const noexcept {
    return shards_.size();
  }

  [[nodiscard]] std::size_t shard_index(std::string_view key) const noexcept;

  std::optional<value_t> get(std::string_view key);

  std::optional<std::string> get_string(std::string_view key);

  void set(std::string_view key, std::string_view value);

  bool del(std::string_view key);

  bool exists(std::string_view key);

  std::size_t lpush(std::string_view key, values_t values);

  std::size_t rpush(std::string_view key, values_t values);

  std::optional<std::string> lpop(std::string_view key);

  std::optional<std::vector<std::string>> lpop(std::string_view key,
                                               std::size_t count);

  std::size_t llen(std::string_view key);

  std::vector<std::string> lrange(std::string_view key, std::int64_t start,
                                  std::int64_t stop);

  /**
   * Pop the head of the first non-empty list among keys, tried in order.
   * @throws wrong_type if a key tried before a non-empty list holds a string
   */
  std::optional<popped_t> try_pop_first(keys_t keys);

  /**
   * Register w on every key, in key order, holding one shard lock at a time.
   * Pushes to any of the keys notify w until the registration is released.
   */
  [[nodiscard]] registration watch(keys_t keys, std::shared_ptr<waiter> w);

  /**
   * Blocking pop for a thread that can afford to park. A zero timeout waits
   * forever. Returns nothing on timeout or when a stop is requested.
   */
  std::optional<popped_t> blpop(keys_t keys, duration timeout,
                                std::stop_token stop = {});

  std::size_t waiter_count(std::string_view key);

private:
  shard &shard_for(std::string_view key) {
    return shards_[shard_index(key)];
  }

  std::vector<shard> shards_;
};

} // namespace valkyrie

#endif // VALKYRIE_ENGINE_HPP
