#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include <edgeperf/exception.hpp>
#include <edgeperf/stream_producer.hpp>

#include "common/sources.hpp"

using namespace edgeperf;
using namespace edgeperftest;

TEST(StreamProducer, ExactMultipleOfChunkSize) {
  StreamProducer producer(ChunkGenerator(), 4 * 1024, 1024);

  for (int i = 0; i < 4; ++i) {
    auto chunk = producer.next();
    ASSERT_TRUE(chunk);
    EXPECT_EQ(chunk->size(), 1024u);
    EXPECT_EQ(producer.state(), StreamState::streaming);
  }

  EXPECT_EQ(producer.bytes_sent(), 4096u);
  EXPECT_EQ(producer.remaining(), 0u);

  EXPECT_FALSE(producer.next());
  EXPECT_EQ(producer.state(), StreamState::closed);
  EXPECT_TRUE(producer.is_terminal());

  // Pulling a closed stream is harmless
  EXPECT_FALSE(producer.next());
  EXPECT_EQ(producer.bytes_sent(), 4096u);
}

TEST(StreamProducer, LastChunkIsShort) {
  StreamProducer producer(ChunkGenerator(), 150000, 65536);
  EXPECT_EQ(producer.chunk_size(), 65536u);
  EXPECT_EQ(producer.total_size(), 150000u);

  std::vector<std::size_t> sizes;
  while (auto chunk = producer.next())
    sizes.push_back(chunk->size());

  ASSERT_EQ(sizes.size(), 3u);
  EXPECT_EQ(sizes[0], 65536u);
  EXPECT_EQ(sizes[1], 65536u);
  EXPECT_EQ(sizes[2], 150000u - 2 * 65536u);
  EXPECT_EQ(producer.bytes_sent(), 150000u);
  EXPECT_EQ(producer.state(), StreamState::closed);
}

TEST(StreamProducer, SizeSmallerThanChunk) {
  StreamProducer producer(ChunkGenerator(), 1024, 65536);

  auto chunk = producer.next();
  ASSERT_TRUE(chunk);
  EXPECT_EQ(chunk->size(), 1024u);
  EXPECT_FALSE(producer.next());
}

TEST(StreamProducer, EmptyStreamClosesImmediately) {
  auto source = std::make_shared<CountingSource>();
  StreamProducer producer(ChunkGenerator(source), 0, 1024);

  EXPECT_FALSE(producer.next());
  EXPECT_EQ(producer.state(), StreamState::closed);
  EXPECT_EQ(source->calls.load(), 0u);
}

TEST(StreamProducer, ZeroChunkSizeIsRejected) {
  EXPECT_THROW(StreamProducer(ChunkGenerator(), 1024, 0),
               std::invalid_argument);
}

TEST(StreamProducer, CancelStopsProduction) {
  auto source = std::make_shared<CountingSource>();
  StreamProducer producer(ChunkGenerator(source), 10 * 1024, 1024);

  ASSERT_TRUE(producer.next());
  producer.cancel();

  EXPECT_EQ(producer.state(), StreamState::cancelled);
  EXPECT_FALSE(producer.next());
  EXPECT_EQ(source->calls.load(), 1u);
  EXPECT_EQ(producer.bytes_sent(), 1024u);
}

TEST(StreamProducer, CancelAfterCloseKeepsClosed) {
  StreamProducer producer(ChunkGenerator(), 512, 1024);

  ASSERT_TRUE(producer.next());
  EXPECT_FALSE(producer.next());
  producer.cancel();
  EXPECT_EQ(producer.state(), StreamState::closed);
}

TEST(StreamProducer, GenerationFailureErrorsTheStream) {
  StreamProducer producer(ChunkGenerator(std::make_shared<FailingSource>(2)),
                          10 * 1024, 1024);

  ASSERT_TRUE(producer.next());
  ASSERT_TRUE(producer.next());
  EXPECT_THROW(producer.next(), RandomSourceError);

  EXPECT_EQ(producer.state(), StreamState::errored);
  EXPECT_EQ(producer.bytes_sent(), 2048u);

  // An errored stream never resumes
  EXPECT_THROW(producer.next(), Exception);

  producer.cancel();
  EXPECT_EQ(producer.state(), StreamState::errored);
}

TEST(StreamProducer, StateNames) {
  EXPECT_EQ(to_string(StreamState::streaming), "streaming");
  EXPECT_EQ(to_string(StreamState::closed), "closed");
  EXPECT_EQ(to_string(StreamState::errored), "errored");
  EXPECT_EQ(to_string(StreamState::cancelled), "cancelled");
}
