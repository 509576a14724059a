#include <courier/crypto/openssl.hpp>
#include <courier/crypto/recover.hpp>
#include <courier/crypto/sign.hpp>

#include <openssl/core_names.h>

#include <array>
#include <vector>

using namespace courier::crypto::openssl;

namespace courier::crypto {

namespace {

struct key_material final {
  bignum_ptr secret{nullptr, BN_free};
  std::array<uint8_t, 65> public_key{};
};

std::optional<key_material> derive_key(const private_key_t& private_key) {
  auto group = make_secp256k1_group();
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto secret = make_bignum(private_key.data(), private_key.size());
  if (!group || !ctx || !secret) {
    return std::nullopt;
  }
  if (BN_is_zero(secret.get()) ||
      BN_cmp(secret.get(), EC_GROUP_get0_order(group.get())) >= 0) {
    return std::nullopt;
  }

  auto point = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point || EC_POINT_mul(group.get(), point.get(), secret.get(), nullptr,
                             nullptr, ctx.get()) != 1) {
    return std::nullopt;
  }

  auto material = key_material{};
  if (EC_POINT_point2oct(group.get(), point.get(),
                         POINT_CONVERSION_UNCOMPRESSED,
                         material.public_key.data(),
                         material.public_key.size(),
                         ctx.get()) != material.public_key.size()) {
    return std::nullopt;
  }
  material.secret = std::move(secret);
  return material;
}

evp_pkey_ptr make_signing_key(const key_material& material) {
  auto empty = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto builder = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!builder) {
    return empty;
  }
  if (OSSL_PARAM_BLD_push_utf8_string(builder.get(),
                                      OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1",
                                      0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             material.secret.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       material.public_key.data(),
                                       material.public_key.size()) != 1) {
    return empty;
  }
  auto params =
      param_ptr{OSSL_PARAM_BLD_to_param(builder.get()), OSSL_PARAM_free};
  if (!params) {
    return empty;
  }

  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return empty;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_KEYPAIR,
                        params.get()) != 1) {
    return empty;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

}  // namespace

std::optional<courier::schema::address_t> address_from_private_key(
    const private_key_t& private_key) {
  auto material = derive_key(private_key);
  if (!material) {
    return std::nullopt;
  }
  return address_from_public_key(
      courier::schema::bytes_view_t{material->public_key});
}

std::optional<courier::schema::secp256k1_signature_t> sign_digest(
    const courier::schema::hash32_t& digest,
    const private_key_t& private_key) {
  auto material = derive_key(private_key);
  if (!material) {
    return std::nullopt;
  }
  auto signer = address_from_public_key(
      courier::schema::bytes_view_t{material->public_key});
  auto pkey = make_signing_key(*material);
  if (!signer || !pkey) {
    return std::nullopt;
  }

  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new(pkey.get(), nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_sign_init(ctx.get()) != 1) {
    return std::nullopt;
  }
  auto der_size = std::size_t{};
  if (EVP_PKEY_sign(ctx.get(), nullptr, &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_PKEY_sign(ctx.get(), der.data(), &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = der.data();
  auto ecdsa_sig = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return std::nullopt;
  }
  const auto* r = ECDSA_SIG_get0_r(ecdsa_sig.get());
  const auto* s = ECDSA_SIG_get0_s(ecdsa_sig.get());

  auto group = make_secp256k1_group();
  auto half_order = make_bignum();
  auto low_s = bignum_ptr{BN_dup(s), BN_free};
  if (!group || !half_order || !low_s) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());
  if (BN_rshift1(half_order.get(), order) != 1) {
    return std::nullopt;
  }
  if (BN_cmp(low_s.get(), half_order.get()) > 0 &&
      BN_sub(low_s.get(), order, s) != 1) {
    return std::nullopt;
  }

  auto signature = courier::schema::secp256k1_signature_t{};
  if (BN_bn2binpad(r, signature.r.data(), signature.r.size()) !=
          static_cast<int>(signature.r.size()) ||
      BN_bn2binpad(low_s.get(), signature.s.data(), signature.s.size()) !=
          static_cast<int>(signature.s.size())) {
    return std::nullopt;
  }

  for (auto v : {uint8_t{27}, uint8_t{28}}) {
    signature.v = v;
    auto recovered = recover_address(digest, signature);
    if (recovered && *recovered == *signer) {
      return signature;
    }
  }
  return std::nullopt;
}

}  // namespace courier::crypto
