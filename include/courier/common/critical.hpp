#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace courier::common {

/// Log an unrecoverable failure and terminate the process.
///
/// Reserved for broken invariants on trusted state (storage I/O, corrupt
/// persisted records). Rejections of untrusted input never come here.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  if (auto logger = spdlog::default_logger()) {
    logger->flush();
  }
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace courier::common
