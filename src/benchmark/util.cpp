#include <benchmark/benchmark.h>

#include <util.hpp>

#include <algorithm>
#include <iterator>
#include <random>
#include <string>

const std::string random_data = []() {
  std::string result;
  std::mt19937 prng(42);
  std::uniform_int_distribution<char> printable_char(33, 126);

  std::generate_n(std::back_inserter(result), 1 << 10,
                  [&]() { return printable_char(prng); });
  return result;
}();

void case_insensitive_hash(benchmark::State &state) {
  valkyrie::util::ci_hash hash;
  for (auto _ : state) {
    std::size_t h;
    benchmark::DoNotOptimize(h = hash(random_data));
    benchmark::ClobberMemory();
  }
}

void case_insensitive_equal(benchmark::State &state) {
  valkyrie::util::ci_equal eq;
  for (auto _ : state) {
    bool result;
    benchmark::DoNotOptimize(result = eq(random_data, random_data));
    benchmark::ClobberMemory();
  }
}

void key_hash(benchmark::State &state) {
  valkyrie::util::cs_hash hash;
  const std::string_view key(random_data.data(), state.range(0));
  for (auto _ : state) {
    std::size_t h;
    benchmark::DoNotOptimize(h = hash(key));
    benchmark::ClobberMemory();
  }
}

BENCHMARK(case_insensitive_hash);
BENCHMARK(case_insensitive_equal);
BENCHMARK(key_hash)->Arg(8)->Arg(64)->Arg(1024);
