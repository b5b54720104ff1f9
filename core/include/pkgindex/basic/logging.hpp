// pkgindex/basic/logging.hpp - Logger construction
#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace pkgindex
{

/// Default logger name used by Corpus when none is injected.
inline constexpr const char * k_default_logger_name = "pkgindex";

/**
 * Return the named stderr logger, creating it on first use.
 *
 * Repeated calls with the same name return the same instance, so independent
 * Corpus objects may share a logger safely.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> make_logger(
  const std::string & name = k_default_logger_name);

}  // namespace pkgindex
