#pragma once
#include <courier/schema/primitives.hpp>

namespace courier::eip712 {

/// keccak(0x19 || 0x01 || domain_separator || struct_hash)
courier::schema::hash32_t digest(
    const courier::schema::hash32_t& domain_separator,
    const courier::schema::hash32_t& struct_hash);

}  // namespace courier::eip712
