#include <benchmark/benchmark.h>

#include <commands.hpp>
#include <engine.hpp>
#include <io.hpp>
#include <request.hpp>
#include <resp.hpp>

#include <algorithm>
#include <array>
#include <functional>
#include <iostream>
#include <random>
#include <sstream>

namespace {
namespace ns = valkyrie::resp;

class recorder : public ns::handler {
  void emplace_back(void (ns::handler::*m)()) {
    events_.emplace_back([m](ns::handler &h) { (h.*m)(); });
  }

public:
  void begin_simple_string() override {
    emplace_back(&ns::handler::begin_simple_string);
  }
  void end_simple_string() override {
    emplace_back(&ns::handler::end_simple_string);
  }
  void begin_error() override { emplace_back(&ns::handler::begin_error); }
  void end_error() override { emplace_back(&ns::handler::end_error); }
  void begin_integer() override { emplace_back(&ns::handler::begin_integer); }
  void end_integer() override { emplace_back(&ns::handler::end_integer); }
  void begin_bulk_string(std::int64_t len) override {
    events_.emplace_back([=](ns::handler &h) { h.begin_bulk_string(len); });
  }
  void end_bulk_string() override {
    emplace_back(&ns::handler::end_bulk_string);
  }
  void begin_array(std::int64_t len) override {
    events_.emplace_back([=](ns::handler &h) { h.begin_array(len); });
  }
  void end_array() override { emplace_back(&ns::handler::end_array); }
  void chars(const char *begin, const char *end) override {
    events_.emplace_back([s = std::string(begin, end)](ns::handler &h) {
      h.chars(s.data(), s.data() + s.size());
    });
  }

  std::vector<std::function<void(ns::handler &)>> events_;
};

void write_random_data(std::mt19937 &prng, ns::writer &writer) {
  std::uniform_int_distribution<int> type_dist(0, 8);
  std::uniform_int_distribution<char> alpha_dist('a', 'z');
  std::uniform_int_distribution<char> num_dist('0', '9');
  std::uniform_int_distribution<char> ascii_dist;
  std::uniform_int_distribution<int> strlen_dist(0, 60);
  std::uniform_int_distribution<int> intlen_dist(1, 15);
  std::uniform_int_distribution<int> arrlen_dist(0, 4);

  auto random_chars = [&](auto len, auto &dist) {
    std::array<char, 64> result{};
    std::generate_n(result.begin(), len, [&]() { return dist(prng); });
    writer.chars(result.begin(), result.begin() + len);
  };

  switch (type_dist(prng)) {
  case 0:
    writer.begin_simple_string();
    random_chars(strlen_dist(prng), alpha_dist);
    writer.end_simple_string();
    break;
  case 1:
    writer.begin_error();
    random_chars(strlen_dist(prng), alpha_dist);
    writer.end_error();
    break;
  case 2:
    writer.begin_integer();
    random_chars(intlen_dist(prng), num_dist);
    writer.end_integer();
    break;
  case 3: {
    auto len = strlen_dist(prng);
    writer.begin_bulk_string(len);
    random_chars(len, ascii_dist);
    writer.end_bulk_string();
    break;
  }
  case 4:
    writer.begin_array(-1);
    writer.end_array();
    break;
  case 5:
    writer.begin_bulk_string(-1);
    writer.end_bulk_string();
    break;
  case 6:
  case 7:
  case 8:
  default: {
    auto len = arrlen_dist(prng);
    writer.begin_array(len);
    for (int i = 0; i < len; ++i) {
      write_random_data(prng, writer);
    }
    writer.end_array();
    break;
  }
  }
}

/**
 * Decode every message in data into h.
 */
void decode_all(const std::string &data, ns::handler &h) {
  const char *begin = data.data();
  const char *const end = data.data() + data.size();
  while (begin != end) {
    const auto [status, next] = ns::decode(begin, end, h);
    if (status != ns::decode_status::complete)
      throw std::logic_error("benchmark data isn't whole messages");
    begin = next;
  }
}

const std::string random_data = []() {
  std::mt19937 prng(42);
  std::ostringstream os;
  ns::writer writer(os);
  for (int i = 0; i < 1 << 10; ++i)
    write_random_data(prng, writer);
  auto result = os.str();
  std::cout << "random_data is [" << result.size() << "] long" << std::endl;
  return result;
}();

const std::vector<std::function<void(ns::handler &)>> random_data_events =
    []() {
      recorder recording;
      decode_all(random_data, recording);
      return std::move(recording.events_);
    }();

// a pipeline of the requests a queue consumer and producer would send
const std::string requests = []() {
  std::ostringstream os;
  for (int i = 0; i < 1 << 10; ++i) {
    const auto key = "queue:" + std::to_string(i % 16);
    os << "*3\r\n$5\r\nRPUSH\r\n$" << key.size() << "\r\n"
       << key << "\r\n$7\r\npayload\r\n"
       << "*3\r\n$5\r\nBLPOP\r\n$" << key.size() << "\r\n"
       << key << "\r\n$1\r\n0\r\n";
  }
  return os.str();
}();

} // namespace

void resp_decoding(benchmark::State &state) {
  for (auto _ : state) {
    ns::null_handler h;
    decode_all(random_data, h);
  }
  state.SetBytesProcessed(std::int64_t(state.iterations()) *
                          std::int64_t(random_data.size()));
}

void resp_writing(benchmark::State &state) {
  for (auto _ : state) {
    state.PauseTiming();
    valkyrie::io::ofstreambuf sb(
        valkyrie::io::file_descriptor(::memfd_create, "resp writing benchmark",
                                      0),
        1 << 20);
    std::ostream os(&sb);
    ns::writer writer(os);
    state.ResumeTiming();
    for (const auto &event : random_data_events)
      event(writer);
    os.flush();
  }
}

void request_building(benchmark::State &state) {
  for (auto _ : state) {
    valkyrie::request_builder b;
    decode_all(requests, b);
    benchmark::DoNotOptimize(b.args().data());
  }
  state.SetBytesProcessed(std::int64_t(state.iterations()) *
                          std::int64_t(requests.size()));
}

void request_dispatching(benchmark::State &state) {
  valkyrie::engine db(state.range(0));

  // replay the pipeline through the dispatcher, discarding replies
  class dispatcher : public valkyrie::request_builder {
  public:
    explicit dispatcher(valkyrie::engine &db) : db_(db) {}

    void run(const std::string &data) {
      const char *begin = data.data();
      const char *const end = data.data() + data.size();
      while (begin != end) {
        begin = std::get<1>(ns::decode(begin, end, *this));
        valkyrie::commands::dispatch(args(), db_, replies_);
      }
    }

  private:
    valkyrie::engine &db_;
    ns::null_handler replies_;
  };

  for (auto _ : state) {
    dispatcher d(db);
    d.run(requests);
  }
}

BENCHMARK(resp_decoding);
BENCHMARK(resp_writing);
BENCHMARK(request_building);
BENCHMARK(request_dispatching)->Arg(1)->Arg(8);
