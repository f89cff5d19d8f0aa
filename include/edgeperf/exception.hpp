// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <stdexcept>
#include <string>

namespace edgeperf {
class Exception : public std::runtime_error
{
public:
  explicit Exception(char const* const msg) noexcept : std::runtime_error(msg)
  {
  }

  explicit Exception(std::string const& msg) noexcept : std::runtime_error(msg)
  {
  }
};

// Thrown when the entropy source cannot produce the requested bytes
class RandomSourceError : public Exception
{
public:
  using Exception::Exception;
};
} // namespace edgeperf
