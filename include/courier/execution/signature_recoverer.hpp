#pragma once

#include <courier/schema/primitives.hpp>
#include <functional>
#include <optional>

namespace courier::execution {

using signature_recoverer_t =
    std::function<std::optional<courier::schema::address_t>(
        const courier::schema::hash32_t& digest,
        const courier::schema::secp256k1_signature_t& signature)>;

}  // namespace courier::execution
