#pragma once

#include <courier/schema/primitives.hpp>
#include <courier/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace courier::schema {

template <uint16_t Version>
struct transaction_result;

/// Outcome of one operation. `code == 0` means committed; any other value
/// is a `transaction_error_code` and nothing was written.
template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace courier::schema
