#include <algorithm>
#include <set>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include <edgeperf/chunk_generator.hpp>
#include <edgeperf/exception.hpp>

#include "common/sources.hpp"

using namespace edgeperf;
using namespace edgeperftest;

TEST(ChunkGenerator, ProducesRequestedSize) {
  ChunkGenerator gen;

  for (std::size_t n : {1u, 7u, 1024u, 65536u, 65537u}) {
    auto chunk = gen.generate(n);
    EXPECT_EQ(chunk.size(), n);
    EXPECT_FALSE(chunk.empty());
    EXPECT_NE(chunk.data(), nullptr);
    EXPECT_EQ(chunk.bytes().size(), n);
  }
}

TEST(ChunkGenerator, ZeroSizeIsRejected) {
  ChunkGenerator gen;
  EXPECT_THROW(gen.generate(0), std::invalid_argument);
}

TEST(ChunkGenerator, NullSourceIsRejected) {
  EXPECT_THROW(ChunkGenerator(nullptr), Exception);
}

TEST(ChunkGenerator, ConsecutiveChunksDiffer) {
  ChunkGenerator gen;

  auto a = gen.generate(65536);
  auto b = gen.generate(65536);
  EXPECT_FALSE(std::equal(a.bytes().begin(), a.bytes().end(),
                          b.bytes().begin()));
}

TEST(ChunkGenerator, OutputIsNotConstant) {
  ChunkGenerator gen;

  auto chunk = gen.generate(4096);
  std::set<std::uint8_t> seen(chunk.bytes().begin(), chunk.bytes().end());
  // 4096 uniform bytes cover nearly all 256 values
  EXPECT_GT(seen.size(), 200u);
}

TEST(ChunkGenerator, UsesInjectedSource) {
  auto source = std::make_shared<CountingSource>();
  ChunkGenerator gen(source);

  auto chunk = gen.generate(300);
  EXPECT_EQ(source->calls.load(), 1u);
  for (std::size_t i = 0; i < chunk.size(); ++i)
    EXPECT_EQ(chunk.data()[i], static_cast<std::uint8_t>(i));
}

TEST(ChunkGenerator, SourceFailurePropagates) {
  ChunkGenerator gen(std::make_shared<FailingSource>());
  EXPECT_THROW(gen.generate(16), RandomSourceError);

  // RandomSourceError is an edgeperf::Exception
  EXPECT_THROW(gen.generate(16), Exception);
}

TEST(ChunkGenerator, ChunkOwnsItsBuffer) {
  ChunkGenerator gen;

  auto chunk = gen.generate(128);
  auto const* data = chunk.data();

  Chunk moved = std::move(chunk);
  EXPECT_EQ(moved.data(), data);
  EXPECT_EQ(moved.size(), 128u);
}
