#include <courier/crypto/openssl.hpp>
#include <courier/crypto/recover.hpp>
#include <courier/keccak/hash.hpp>

#include <algorithm>
#include <array>

using namespace courier::crypto::openssl;

namespace courier::crypto {

namespace {

std::optional<int> normalize_recovery_id(uint8_t v) {
  if (v == 0 || v == 1) {
    return v;
  }
  if (v == 27 || v == 28) {
    return v - 27;
  }
  return std::nullopt;
}

}  // namespace

bool available() {
  static const auto available_now =
      static_cast<bool>(make_secp256k1_group());
  return available_now;
}

std::optional<courier::schema::address_t> address_from_public_key(
    const courier::schema::bytes_view_t& public_key) {
  auto coordinates = public_key;
  if (public_key.size() == 65) {
    if (public_key[0] != 0x04) {
      return std::nullopt;
    }
    coordinates = public_key.subspan(1);
  }
  if (coordinates.size() != 64) {
    return std::nullopt;
  }
  auto hash = courier::keccak::hash(coordinates);
  auto address = courier::schema::address_t{};
  std::copy(std::end(hash) - address.size(), std::end(hash),
            std::begin(address));
  return address;
}

std::optional<courier::schema::address_t> recover_address(
    const courier::schema::hash32_t& digest,
    const courier::schema::secp256k1_signature_t& signature) {
  auto recovery_id = normalize_recovery_id(signature.v);
  if (!recovery_id) {
    return std::nullopt;
  }

  auto group = make_secp256k1_group();
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  if (!group || !ctx) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());

  auto r = make_bignum(signature.r.data(), signature.r.size());
  auto s = make_bignum(signature.s.data(), signature.s.size());
  auto e = make_bignum(digest.data(), digest.size());
  auto half_order = make_bignum();
  if (!r || !s || !e || !half_order ||
      BN_rshift1(half_order.get(), order) != 1) {
    return std::nullopt;
  }
  if (BN_is_zero(r.get()) || BN_cmp(r.get(), order) >= 0) {
    return std::nullopt;
  }
  if (BN_is_zero(s.get()) || BN_cmp(s.get(), half_order.get()) > 0) {
    return std::nullopt;
  }

  // R = (r, y) with the parity of y taken from the recovery id.
  auto big_r = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!big_r || EC_POINT_set_compressed_coordinates(
                    group.get(), big_r.get(), r.get(), *recovery_id & 1,
                    ctx.get()) != 1) {
    return std::nullopt;
  }

  // Q = r^-1 (s R - e G) = (-e r^-1) G + (s r^-1) R
  auto r_inverse = bignum_ptr{
      BN_mod_inverse(nullptr, r.get(), order, ctx.get()), BN_free};
  auto e_mod = make_bignum();
  auto e_negated = make_bignum();
  auto u1 = make_bignum();
  auto u2 = make_bignum();
  if (!r_inverse || !e_mod || !e_negated || !u1 || !u2) {
    return std::nullopt;
  }
  if (BN_nnmod(e_mod.get(), e.get(), order, ctx.get()) != 1 ||
      BN_mod_sub(e_negated.get(), order, e_mod.get(), order, ctx.get()) != 1 ||
      BN_mod_mul(u1.get(), e_negated.get(), r_inverse.get(), order,
                 ctx.get()) != 1 ||
      BN_mod_mul(u2.get(), s.get(), r_inverse.get(), order, ctx.get()) != 1) {
    return std::nullopt;
  }

  auto q = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!q || EC_POINT_mul(group.get(), q.get(), u1.get(), big_r.get(),
                         u2.get(), ctx.get()) != 1) {
    return std::nullopt;
  }
  if (EC_POINT_is_at_infinity(group.get(), q.get()) == 1) {
    return std::nullopt;
  }

  auto encoded = std::array<uint8_t, 65>{};
  if (EC_POINT_point2oct(group.get(), q.get(), POINT_CONVERSION_UNCOMPRESSED,
                         encoded.data(), encoded.size(),
                         ctx.get()) != encoded.size()) {
    return std::nullopt;
  }
  return address_from_public_key(courier::schema::bytes_view_t{encoded});
}

bool verify_signature(
    const courier::schema::hash32_t& digest,
    const courier::schema::address_t& signer,
    const courier::schema::secp256k1_signature_t& signature) {
  auto recovered = recover_address(digest, signature);
  return recovered.has_value() && !courier::schema::is_zero(*recovered) &&
         *recovered == signer;
}

}  // namespace courier::crypto
