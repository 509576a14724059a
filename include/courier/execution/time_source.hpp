#pragma once

#include <chrono>
#include <courier/schema/primitives.hpp>
#include <functional>

namespace courier::execution {

/// Current Unix time in seconds, as seen by authorization window checks.
using time_source_t = std::function<courier::schema::timestamp_seconds_t()>;

inline time_source_t system_time_source() {
  return [] {
    return static_cast<courier::schema::timestamp_seconds_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

}  // namespace courier::execution
