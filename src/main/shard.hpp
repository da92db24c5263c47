#ifndef VALKYRIE_SHARD_HPP
#define VALKYRIE_SHARD_HPP

#include "util.hpp"
#include "waiter.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace valkyrie {

class wrong_type : public std::runtime_error {
public:
  wrong_type()
      : std::runtime_error(
            "WRONGTYPE Operation against a key holding the wrong kind of "
            "value") {}
};

using list_t = std::deque<std::string>;
using value_t = std::variant<std::string, list_t>;

/**
 * One independently locked slice of the keyspace together with the waiters
 * blocked on its keys. Every public member takes the shard lock for the
 * duration of the call and nothing else.
 */
class shard {
public:
  using map_t = ankerl::unordered_dense::map<std::string, value_t,
                                             util::cs_hash, std::equal_to<>>;
  using waiters_t = std::vector<std::shared_ptr<waiter>>;
  using registry_t =
      ankerl::unordered_dense::map<std::string, waiters_t, util::cs_hash,
                                   std::equal_to<>>;
  using values_t = std::span<const std::string_view>;

  shard() = default;
  shard(const shard &) = delete;
  shard &operator=(const shard &) = delete;

  std::optional<value_t> get(std::string_view key);

  /**
   * @throws wrong_type if key holds a list
   */
  std::optional<std::string> get_string(std::string_view key);

  void set(std::string_view key, std::string_view value);

  bool del(std::string_view key);

  bool exists(std::string_view key);

  /**
   * Push each value onto the head in turn, creating the list if needed, then
   * wake the key's waiters.
   * @return the length of the list after the push
   * @throws wrong_type if key holds a string
   */
  std::size_t lpush(std::string_view key, values_t values);

  /**
   * As lpush() but onto the tail.
   */
  std::size_t rpush(std::string_view key, values_t values);

  std::optional<std::string> lpop(std::string_view key);

  std::optional<std::vector<std::string>> lpop(std::string_view key,
                                               std::size_t count);

  std::size_t llen(std::string_view key);

  std::vector<std::string> lrange(std::string_view key, std::int64_t start,
                                  std::int64_t stop);

  void add_waiter(std::string_view key, std::shared_ptr<waiter> w);

  void remove_waiter(std::string_view key, const waiter *w);

  std::size_t waiter_count(std::string_view key);

private:
  list_t *find_list(std::string_view key);

  std::size_t push(std::string_view key, values_t values,
                   void (*push)(list_t &, std::string_view));

  std::mutex mutex_;
  map_t map_;
  registry_t waiters_;
};

} // namespace valkyrie

#endif // VALKYRIE_SHARD_HPP
