#include "engine.hpp"

#include <stdexcept>
#include <utility>

namespace {

std::size_t validated_shard_count(std::size_t n) {
  if (n == 0)
    throw std::invalid_argument("shard count must be at least 1");
  return n;
}

} // namespace

valkyrie::engine::registration::registration(engine &e, keys_t keys,
                                             std::shared_ptr<waiter> w)
    : engine_(&e), keys_(keys.begin(), keys.end()), waiter_(std::move(w)) {
  try {
    for (const auto &key : keys_)
      engine_->shard_for(key).add_waiter(key, waiter_);
  } catch (...) {
    release();
    throw;
  }
}

valkyrie::engine::registration::registration(registration &&that) noexcept
    : engine_(std::exchange(that.engine_, nullptr)),
      keys_(std::move(that.keys_)), waiter_(std::move(that.waiter_)) {}

valkyrie::engine::registration &
valkyrie::engine::registration::operator=(registration &&that) noexcept {
  release();
  engine_ = std::exchange(that.engine_, nullptr);
  keys_ = std::move(that.keys_);
  waiter_ = std::move(that.waiter_);
  return *this;
}

valkyrie::engine::registration::~registration() { release(); }

void valkyrie::engine::registration::release() noexcept {
  if (auto e = std::exchange(engine_, nullptr)) {
    for (const auto &key : keys_)
      e->shard_for(key).remove_waiter(key, waiter_.get());
    keys_.clear();
    waiter_.reset();
  }
}

valkyrie::engine::engine(std::size_t shard_count)
    : shards_(validated_shard_count(shard_count)) {}

std::size_t
valkyrie::engine::shard_index(std::string_view key) const noexcept {
  return util::cs_hash{}(key) % shards_.size();
}

std::optional<valkyrie::value_t> valkyrie::engine::get(std::string_view key) {
  return shard_for(key).get(key);
}

std::optional<std::string>
valkyrie::engine::get_string(std::string_view key) {
  return shard_for(key).get_string(key);
}

void valkyrie::engine::set(std::string_view key, std::string_view value) {
  shard_for(key).set(key, value);
}

bool valkyrie::engine::del(std::string_view key) {
  return shard_for(key).del(key);
}

bool valkyrie::engine::exists(std::string_view key) {
  return shard_for(key).exists(key);
}

std::size_t valkyrie::engine::lpush(std::string_view key, values_t values) {
  return shard_for(key).lpush(key, values);
}

std::size_t valkyrie::engine::rpush(std::string_view key, values_t values) {
  return shard_for(key).rpush(key, values);
}

std::optional<std::string> valkyrie::engine::lpop(std::string_view key) {
  return shard_for(key).lpop(key);
}

std::optional<std::vector<std::string>>
valkyrie::engine::lpop(std::string_view key, std::size_t count) {
  return shard_for(key).lpop(key, count);
}

std::size_t valkyrie::engine::llen(std::string_view key) {
  return shard_for(key).llen(key);
}

std::vector<std::string> valkyrie::engine::lrange(std::string_view key,
                                                  std::int64_t start,
                                                  std::int64_t stop) {
  return shard_for(key).lrange(key, start, stop);
}

std::optional<valkyrie::engine::popped_t>
valkyrie::engine::try_pop_first(keys_t keys) {
  for (const auto &key : keys) {
    if (auto element = lpop(key))
      return popped_t{std::string(key), std::move(*element)};
  }
  return {};
}

valkyrie::engine::registration
valkyrie::engine::watch(keys_t keys, std::shared_ptr<waiter> w) {
  return {*this, keys, std::move(w)};
}

std::optional<valkyrie::engine::popped_t>
valkyrie::engine::blpop(keys_t keys, duration timeout, std::stop_token stop) {
  if (auto popped = try_pop_first(keys))
    return popped;

  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (timeout != duration::zero())
    deadline = std::chrono::steady_clock::now() + timeout;

  auto w = std::make_shared<condition_waiter>();
  auto reg = watch(keys, w);

  for (;;) {
    // a push may have landed between the first attempt and registration, so
    // check again before every wait
    if (auto popped = try_pop_first(keys)) {
      reg.release();
      return popped;
    }
    if (!w->wait(deadline, stop)) {
      reg.release();
      return {};
    }
  }
}

std::size_t valkyrie::engine::waiter_count(std::string_view key) {
  return shard_for(key).waiter_count(key);
}
