#include "h1stream/http/request_parser.hpp"

#include <benchmark/benchmark.h>

#include <memory>
#include <string>
#include <variant>

using namespace h1stream;

namespace {

const std::string kSimpleGet =
    "GET /api/v1/items?page=2&limit=50 HTTP/1.1\r\n"
    "Host: api.example.com\r\n"
    "User-Agent: Mozilla/5.0 (X11; Linux x86_64)\r\n"
    "Accept: application/json\r\n"
    "Accept-Encoding: gzip, deflate\r\n"
    "Connection: keep-alive\r\n"
    "\r\n";

const std::string kChunkedPost =
    "POST /upload HTTP/1.1\r\n"
    "Host: api.example.com\r\n"
    "Transfer-Encoding: chunked\r\n"
    "Content-Type: application/octet-stream\r\n"
    "\r\n"
    "10\r\n0123456789abcdef\r\n"
    "10\r\n0123456789abcdef\r\n"
    "0\r\n\r\n";

auto settings() -> SharedSettings {
  static const auto shared = std::make_shared<const ParserSettings>();
  return shared;
}

// Pulls until the parser asks for more input
auto drain(http::RequestParser& parser, http::RequestOutput out)
    -> std::size_t {
  std::size_t events = 0;
  while (!std::holds_alternative<http::NeedMoreData>(out) &&
         !std::holds_alternative<http::StreamEnd>(out)) {
    ++events;
    out = parser.pull();
  }
  return events;
}

}  // namespace

static void BM_ParseSimpleGet(benchmark::State& state) {
  for (auto _ : state) {
    http::RequestParser parser(settings());
    auto events = drain(parser, parser.push(kSimpleGet));
    benchmark::DoNotOptimize(events);
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) *
                          static_cast<int64_t>(kSimpleGet.size()));
}

static void BM_ParsePipelined(benchmark::State& state) {
  std::string input;
  for (int64_t i = 0; i < state.range(0); ++i) {
    input += kSimpleGet;
  }

  for (auto _ : state) {
    http::RequestParser parser(settings());
    auto events = drain(parser, parser.push(input));
    benchmark::DoNotOptimize(events);
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                          state.range(0));
}

static void BM_ParseChunkedPost(benchmark::State& state) {
  for (auto _ : state) {
    http::RequestParser parser(settings());
    auto events = drain(parser, parser.push(kChunkedPost));
    benchmark::DoNotOptimize(events);
  }
}

static void BM_ParseFragmented(benchmark::State& state) {
  const auto fragment = static_cast<std::size_t>(state.range(0));
  std::string_view input = kSimpleGet;

  for (auto _ : state) {
    http::RequestParser parser(settings());
    std::size_t events = 0;
    for (std::size_t pos = 0; pos < input.size(); pos += fragment) {
      events += drain(parser, parser.push(input.substr(pos, fragment)));
    }
    benchmark::DoNotOptimize(events);
  }
}

BENCHMARK(BM_ParseSimpleGet);
BENCHMARK(BM_ParsePipelined)->Arg(1)->Arg(8)->Arg(64);
BENCHMARK(BM_ParseChunkedPost);
BENCHMARK(BM_ParseFragmented)->Arg(1)->Arg(16)->Arg(64);
