// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <edgeperf/exception.hpp>
#include <edgeperf/random_source.hpp>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <climits>
#include <string>

namespace edgeperf {

void OpenSslRandomSource::fill(std::span<std::uint8_t> out)
{
  // RAND_bytes takes an int length
  while (!out.empty()) {
    auto const n = std::min<std::size_t>(out.size(), INT_MAX);
    if (RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
      char buf[256];
      ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
      throw RandomSourceError(std::string("RAND_bytes failed: ") + buf);
    }
    out = out.subspan(n);
  }
}

EDGEPERF_API std::shared_ptr<RandomSource> default_random_source()
{
  static auto const source = std::make_shared<OpenSslRandomSource>();
  return source;
}

} // namespace edgeperf
