#pragma once
#include <courier/schema/cancel_authorization.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/receive_with_authorization.hpp>
#include <courier/schema/transfer_with_authorization.hpp>
#include <span>
#include <string_view>
#include <variant>

namespace courier::eip712 {

inline constexpr std::string_view kTransferWithAuthorizationType{
    "TransferWithAuthorization(address from,address to,uint256 value,uint256 "
    "validAfter,uint256 validBefore,bytes32 nonce)"};
inline constexpr std::string_view kReceiveWithAuthorizationType{
    "ReceiveWithAuthorization(address from,address to,uint256 value,uint256 "
    "validAfter,uint256 validBefore,bytes32 nonce)"};
inline constexpr std::string_view kCancelAuthorizationType{
    "CancelAuthorization(address authorizer,bytes32 nonce)"};

/// A statically sized struct member. Strings are passed already hashed.
using field_t = std::variant<courier::schema::address_t,
                             courier::schema::hash32_t,
                             courier::schema::uint256_t>;

courier::schema::hash32_t transfer_with_authorization_typehash();
courier::schema::hash32_t receive_with_authorization_typehash();
courier::schema::hash32_t cancel_authorization_typehash();

/// keccak(typehash || word(field_0) || ... || word(field_n)), fields in
/// declaration order.
courier::schema::hash32_t struct_hash(const courier::schema::hash32_t& typehash,
                                      std::span<const field_t> fields);

courier::schema::hash32_t struct_hash(
    const courier::schema::transfer_with_authorization_t& message);
courier::schema::hash32_t struct_hash(
    const courier::schema::receive_with_authorization_t& message);
courier::schema::hash32_t struct_hash(
    const courier::schema::cancel_authorization_t& message);

}  // namespace courier::eip712
