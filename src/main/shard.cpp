#include "shard.hpp"

#include <algorithm>

using valkyrie::util::overloaded;

namespace {

valkyrie::list_t &as_list(valkyrie::value_t &value) {
  return std::visit(
      overloaded{
          [](valkyrie::list_t &l) -> valkyrie::list_t & { return l; },
          [](auto &) -> valkyrie::list_t & { throw valkyrie::wrong_type(); },
      },
      value);
}

} // namespace

std::optional<valkyrie::value_t> valkyrie::shard::get(std::string_view key) {
  std::lock_guard lock(mutex_);
  if (const auto pos = map_.find(key); pos != map_.end())
    return pos->second;
  return {};
}

std::optional<std::string>
valkyrie::shard::get_string(std::string_view key) {
  std::lock_guard lock(mutex_);
  if (const auto pos = map_.find(key); pos != map_.end()) {
    return std::visit(
        overloaded{
            [](const std::string &s) -> std::string { return s; },
            [](const auto &) -> std::string { throw wrong_type(); },
        },
        pos->second);
  }
  return {};
}

void valkyrie::shard::set(std::string_view key, std::string_view value) {
  std::lock_guard lock(mutex_);
  if (auto pos = map_.find(key); pos == map_.end()) {
    map_.emplace(std::piecewise_construct, std::forward_as_tuple(key),
                 std::forward_as_tuple(std::in_place_type<std::string>,
                                       value));
  } else {
    pos->second.emplace<std::string>(value);
  }
}

bool valkyrie::shard::del(std::string_view key) {
  std::lock_guard lock(mutex_);
  if (const auto pos = map_.find(key); pos != map_.end()) {
    map_.erase(pos);
    return true;
  }
  return false;
}

bool valkyrie::shard::exists(std::string_view key) {
  std::lock_guard lock(mutex_);
  return map_.contains(key);
}

std::size_t valkyrie::shard::lpush(std::string_view key, values_t values) {
  return push(key, values, [](list_t &list, std::string_view value) {
    list.emplace_front(value);
  });
}

std::size_t valkyrie::shard::rpush(std::string_view key, values_t values) {
  return push(key, values, [](list_t &list, std::string_view value) {
    list.emplace_back(value);
  });
}

std::size_t valkyrie::shard::push(std::string_view key, values_t values,
                                  void (*push)(list_t &, std::string_view)) {
  if (values.empty())
    return llen(key);

  waiters_t woken;
  std::size_t result{};

  {
    std::lock_guard lock(mutex_);

    auto pos = map_.find(key);
    if (pos == map_.end()) {
      pos = map_.emplace(std::piecewise_construct, std::forward_as_tuple(key),
                         std::forward_as_tuple(std::in_place_type<list_t>))
                .first;
    }

    auto &list = as_list(pos->second);
    for (const auto &value : values)
      push(list, value);
    result = list.size();

    if (const auto w = waiters_.find(key); w != waiters_.end())
      woken = w->second;
  }

  // the elements are in the map and the lock is released, so a woken waiter
  // either finds an element or loses it to someone who got there first
  for (const auto &w : woken)
    w->notify();

  return result;
}

std::optional<std::string> valkyrie::shard::lpop(std::string_view key) {
  std::lock_guard lock(mutex_);

  const auto pos = map_.find(key);
  if (pos == map_.end())
    return {};

  auto &list = as_list(pos->second);
  std::optional<std::string> result;
  if (!list.empty()) {
    result = std::move(list.front());
    list.pop_front();
  }
  if (list.empty())
    map_.erase(pos);
  return result;
}

std::optional<std::vector<std::string>>
valkyrie::shard::lpop(std::string_view key, std::size_t count) {
  std::lock_guard lock(mutex_);

  const auto pos = map_.find(key);
  if (pos == map_.end())
    return {};

  auto &list = as_list(pos->second);
  const auto n = std::min(count, list.size());
  std::vector<std::string> result(std::make_move_iterator(list.begin()),
                                  std::make_move_iterator(list.begin() + n));
  list.erase(list.begin(), list.begin() + n);
  if (list.empty())
    map_.erase(pos);
  return result;
}

std::size_t valkyrie::shard::llen(std::string_view key) {
  std::lock_guard lock(mutex_);
  const auto list = find_list(key);
  return list ? list->size() : 0;
}

std::vector<std::string> valkyrie::shard::lrange(std::string_view key,
                                                 std::int64_t start,
                                                 std::int64_t stop) {
  std::lock_guard lock(mutex_);

  const auto list = find_list(key);
  if (!list)
    return {};

  const auto len = std::int64_t(list->size());
  if (start < 0)
    start = std::max(std::int64_t(0), start + len);
  if (stop < 0)
    stop += len;
  stop = std::min(stop, len - 1);

  if (start > stop || start >= len)
    return {};

  return std::vector<std::string>(list->begin() + start,
                                  list->begin() + stop + 1);
}

void valkyrie::shard::add_waiter(std::string_view key,
                                 std::shared_ptr<waiter> w) {
  std::lock_guard lock(mutex_);
  if (auto pos = waiters_.find(key); pos != waiters_.end()) {
    pos->second.push_back(std::move(w));
  } else {
    waiters_.emplace(std::piecewise_construct, std::forward_as_tuple(key),
                     std::forward_as_tuple(waiters_t{std::move(w)}));
  }
}

void valkyrie::shard::remove_waiter(std::string_view key, const waiter *w) {
  std::lock_guard lock(mutex_);
  if (auto pos = waiters_.find(key); pos != waiters_.end()) {
    std::erase_if(pos->second, [w](const auto &p) { return p.get() == w; });
    if (pos->second.empty())
      waiters_.erase(pos);
  }
}

std::size_t valkyrie::shard::waiter_count(std::string_view key) {
  std::lock_guard lock(mutex_);
  const auto pos = waiters_.find(key);
  return pos == waiters_.end() ? 0 : pos->second.size();
}

valkyrie::list_t *valkyrie::shard::find_list(std::string_view key) {
  if (const auto pos = map_.find(key); pos != map_.end())
    return &as_list(pos->second);
  return nullptr;
}
