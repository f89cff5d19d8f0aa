// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <edgeperf/error.hpp>

#include <string>

namespace edgeperf {

namespace {
class edgeperf_error_category : public boost::system::error_category
{
public:
  const char* name() const noexcept override { return "edgeperf"; }

  std::string message(int ev) const override
  {
    switch (static_cast<error>(ev)) {
    case error::generation_failed:
      return "random data generation failed";
    default:
      return "edgeperf error";
    }
  }
};
} // namespace

EDGEPERF_API boost::system::error_category const& error_category() noexcept
{
  static edgeperf_error_category const category;
  return category;
}

} // namespace edgeperf
