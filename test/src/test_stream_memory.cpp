// Replaces the global allocation functions to observe how much heap a
// download stream holds at once. Built as its own executable.

#include <atomic>
#include <cstdlib>
#include <new>

#include <gtest/gtest.h>

#include "common/serialize.hpp"
#include "http/random_body.hpp"

namespace {

std::atomic<bool> g_tracking{false};
std::atomic<std::int64_t> g_live{0};
std::atomic<std::int64_t> g_peak{0};

constexpr std::size_t header_size = alignof(std::max_align_t);

void* tracked_alloc(std::size_t n)
{
  auto* p = static_cast<unsigned char*>(std::malloc(n + header_size));
  if (!p)
    throw std::bad_alloc();

  // Only allocations made while tracking are accounted for on release
  std::size_t const tracked = g_tracking.load() ? n : 0;
  *reinterpret_cast<std::size_t*>(p) = tracked;

  if (tracked) {
    auto const live = g_live.fetch_add(tracked) + static_cast<std::int64_t>(tracked);
    auto peak = g_peak.load();
    while (live > peak && !g_peak.compare_exchange_weak(peak, live)) {
    }
  }
  return p + header_size;
}

void tracked_free(void* ptr) noexcept
{
  if (!ptr)
    return;
  auto* p = static_cast<unsigned char*>(ptr) - header_size;
  auto const tracked = *reinterpret_cast<std::size_t*>(p);
  if (tracked)
    g_live.fetch_sub(static_cast<std::int64_t>(tracked));
  std::free(p);
}

struct AllocationScope {
  AllocationScope()
  {
    g_live = 0;
    g_peak = 0;
    g_tracking = true;
  }
  ~AllocationScope() { g_tracking = false; }

  std::int64_t peak() const { return g_peak.load(); }
};

} // namespace

void* operator new(std::size_t n) { return tracked_alloc(n); }
void* operator new[](std::size_t n) { return tracked_alloc(n); }
void operator delete(void* p) noexcept { tracked_free(p); }
void operator delete[](void* p) noexcept { tracked_free(p); }
void operator delete(void* p, std::size_t) noexcept { tracked_free(p); }
void operator delete[](void* p, std::size_t) noexcept { tracked_free(p); }

using namespace edgeperf;
using namespace edgeperf::impl;
using namespace edgeperftest;

TEST(StreamMemory, LiveBytesStayWithinOneChunk) {
  constexpr std::size_t chunk_size = 64 * 1024;
  constexpr std::uint64_t size = 32ull * 1024 * 1024;

  http::response<random_body> res{http::status::ok, 11,
      random_body::value_type{size, chunk_size, ChunkGenerator()}};
  res.content_length(size);

  SerializeResult r;
  std::int64_t peak = 0;
  {
    AllocationScope scope;
    r = serialize(res);
    peak = scope.peak();
  }

  ASSERT_FALSE(r.ec);
  EXPECT_EQ(r.body_bytes, size);

  // One chunk in flight plus bookkeeping, independent of the total size
  EXPECT_GE(peak, static_cast<std::int64_t>(chunk_size));
  EXPECT_LT(peak, static_cast<std::int64_t>(2 * chunk_size));
}

TEST(StreamMemory, PeakDoesNotGrowWithSize) {
  constexpr std::size_t chunk_size = 16 * 1024;

  auto measure = [&](std::uint64_t size) {
    http::response<random_body> res{http::status::ok, 11,
      random_body::value_type{size, chunk_size, ChunkGenerator()}};
    res.content_length(size);

    AllocationScope scope;
    auto const r = serialize(res);
    EXPECT_EQ(r.body_bytes, size);
    return scope.peak();
  };

  auto const small = measure(1024 * 1024);
  auto const large = measure(16 * 1024 * 1024);
  EXPECT_LT(large, 2 * static_cast<std::int64_t>(chunk_size));
  EXPECT_LE(large - small, static_cast<std::int64_t>(chunk_size));
}
