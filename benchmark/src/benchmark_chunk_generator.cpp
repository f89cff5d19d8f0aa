// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// edgeperf Benchmarks - chunk generation and stream serialization

#include <benchmark/benchmark.h>

#include <edgeperf/chunk_generator.hpp>
#include <edgeperf/stream_producer.hpp>


#include "http/random_body.hpp"

namespace edgeperf::benchmark {

using namespace edgeperf::impl;

// Raw cost of filling one chunk from the OpenSSL generator
static void BM_GenerateChunk(::benchmark::State& state)
{
  ChunkGenerator gen;
  auto const size = static_cast<std::size_t>(state.range(0));

  for (auto _ : state) {
    auto chunk = gen.generate(size);
    ::benchmark::DoNotOptimize(chunk.data());
  }

  state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_GenerateChunk)->RangeMultiplier(4)->Range(1024, 1024 * 1024);

// Whole stream through the producer, as the download path pulls it
static void BM_ProduceStream(::benchmark::State& state)
{
  constexpr std::uint64_t total = 16 * MiB;
  auto const chunk_size = static_cast<std::size_t>(state.range(0));
  ChunkGenerator gen;

  for (auto _ : state) {
    StreamProducer producer(gen, total, chunk_size);
    while (auto chunk = producer.next())
      ::benchmark::DoNotOptimize(chunk->data());
  }

  state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(total));
}
BENCHMARK(BM_ProduceStream)
    ->Arg(16 * 1024)
    ->Arg(64 * 1024)
    ->Arg(256 * 1024)
    ->Unit(::benchmark::kMillisecond);

// Serializer overhead on top of generation
static void BM_SerializeRandomBody(::benchmark::State& state)
{
  constexpr std::uint64_t total = 16 * MiB;

  http::response<random_body> res{http::status::ok, 11,
      random_body::value_type{
          total, static_cast<std::size_t>(state.range(0)), ChunkGenerator()}};
  res.content_length(total);

  for (auto _ : state) {
    http::response_serializer<random_body> sr{res};
    beast::error_code ec;
    while (!sr.is_done()) {
      sr.next(ec, [&](beast::error_code& ec, auto const& buffers) {
        ec = {};
        auto const n = net::buffer_size(buffers);
        ::benchmark::DoNotOptimize(n);
        sr.consume(n);
      });
      if (ec) {
        state.SkipWithError(ec.message().c_str());
        return;
      }
    }
  }

  state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(total));
}
BENCHMARK(BM_SerializeRandomBody)
    ->Arg(64 * 1024)
    ->Unit(::benchmark::kMillisecond);

} // namespace edgeperf::benchmark
