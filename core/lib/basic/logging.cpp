// pkgindex/basic/logging.cpp - Logger construction
#include "pkgindex/basic/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace pkgindex
{

std::shared_ptr<spdlog::logger> make_logger(const std::string & name)
{
  if (auto existing = spdlog::get(name)) {
    return existing;
  }

  try {
    return spdlog::stderr_color_mt(name);
  } catch (const spdlog::spdlog_ex &) {
    // Lost a registration race with another thread.
    if (auto existing = spdlog::get(name)) {
      return existing;
    }
    throw;
  }
}

}  // namespace pkgindex
