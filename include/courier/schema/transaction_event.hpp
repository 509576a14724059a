#pragma once

#include <courier/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Notification emitted by a committed operation, in emission order.
namespace courier::schema {

inline constexpr auto kAuthorizationUsedEvent =
    std::string_view{"authorization_used"};
inline constexpr auto kAuthorizationCanceledEvent =
    std::string_view{"authorization_canceled"};
inline constexpr auto kTransferEvent = std::string_view{"transfer"};

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

}  // namespace courier::schema
