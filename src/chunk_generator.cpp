// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <edgeperf/chunk_generator.hpp>
#include <edgeperf/exception.hpp>

#include <stdexcept>

namespace edgeperf {

ChunkGenerator::ChunkGenerator(std::shared_ptr<RandomSource> source)
    : source_(std::move(source))
{
  if (!source_)
    throw Exception("ChunkGenerator requires a random source");
}

Chunk ChunkGenerator::generate(std::size_t n) const
{
  if (n == 0)
    throw std::invalid_argument("chunk size must be positive");

  // Every byte is overwritten by the source, skip value-initialization
  auto data = std::make_unique_for_overwrite<std::uint8_t[]>(n);
  source_->fill({data.get(), n});
  return Chunk(std::move(data), n);
}

} // namespace edgeperf
