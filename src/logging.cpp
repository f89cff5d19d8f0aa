// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "logging.hpp"

#include <edgeperf/exception.hpp>

namespace edgeperf::impl {

EDGEPERF_API std::shared_ptr<SimpleLogger>& get_logger()
{
  static std::shared_ptr<SimpleLogger> logger =
      std::make_shared<SimpleLogger>("edgeperf", LogLevel::info);
  return logger;
}

EDGEPERF_API LogLevel parse_log_level(std::string_view name)
{
  for (auto lvl : {LogLevel::trace, LogLevel::debug, LogLevel::info,
                   LogLevel::warn, LogLevel::error, LogLevel::critical,
                   LogLevel::off}) {
    if (name == SimpleLogger::level_name(lvl))
      return lvl;
  }
  throw Exception("unknown log level: " + std::string(name));
}

} // namespace edgeperf::impl
