#ifndef VALKYRIE_UTIL_HPP
#define VALKYRIE_UTIL_HPP

#include <ankerl/unordered_dense.h>

#include <array>
#include <cassert>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace valkyrie::util {

// ascii-only case folding, every other byte maps to itself
inline constexpr auto ucase_lookup = []() {
  std::array<unsigned char, 256> result{};
  for (std::size_t i = 0; i < result.size(); ++i)
    result[i] = static_cast<unsigned char>(i);
  for (unsigned char c = 'a'; c <= 'z'; ++c)
    result[c] = static_cast<unsigned char>(c - 'a' + 'A');
  return result;
}();

/**
 * Case sensitive, avalanching hash for binary-safe keys. Used both to pick a
 * shard and to index a shard's maps.
 */
class cs_hash {
public:
  using is_transparent = void;
  using is_avalanching = void;

  auto operator()(const std::string_view s) const noexcept {
    return ankerl::unordered_dense::hash<std::string_view>{}(s);
  }
};

class ci_hash {
public:
  using is_transparent = void;

  template <typename T>
  auto operator()(const T &t) const noexcept
      -> decltype(std::string_view(t), std::size_t{}) {
    std::uint64_t result{};
    for (const unsigned char c : std::string_view(t))
      result = 17000069 * result + ucase_lookup[c];
    return result;
  }
};

class ci_equal {
public:
  using is_transparent = void;

  bool operator()(const std::string_view lhs,
                  const std::string_view rhs) const noexcept {
    if (lhs.size() != rhs.size())
      return false;

    for (auto i = lhs.begin(), e = lhs.end(), j = rhs.begin(); i != e;
         ++i, ++j) {
      if (ucase_lookup[static_cast<unsigned char>(*i)] !=
          ucase_lookup[static_cast<unsigned char>(*j)]) {
        return false;
      }
    }

    assert(ci_hash()(lhs) == ci_hash()(rhs));
    return true;
  }
};

inline std::string to_lower(std::string_view s) {
  std::string result(s);
  for (auto &c : result) {
    if (c >= 'A' && c <= 'Z')
      c = static_cast<char>(c - 'A' + 'a');
  }
  return result;
}

/**
 * Call visitor(token_begin, token_end) for each whitespace separated token in
 * [begin, end). The visitor returns false to stop early.
 */
template <typename Visitor>
auto tokenize(const char *begin, const char *end, Visitor visitor)
    -> decltype(bool(visitor(begin, end)), void()) {

  const auto is_space = [](const unsigned char c) -> bool {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' ||
           c == '\f';
  };

  const char *token_begin{};

  for (auto i = begin; i != end; ++i) {
    if (token_begin && is_space(*i)) {
      if (!visitor(std::exchange(token_begin, nullptr), i)) {
        return;
      }
    } else if (!token_begin && !is_space(*i)) {
      token_begin = i;
    }
  }

  if (token_begin)
    visitor(token_begin, end);
}

template <typename... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace valkyrie::util

#endif // VALKYRIE_UTIL_HPP
