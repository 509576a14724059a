#pragma once
#include <courier/crypto/openssl.hpp>
#include <courier/schema/primitives.hpp>
#include <string_view>

// Keccak-256 as used by Ethereum (original Keccak padding, not SHA3-256).
namespace courier::keccak {

/// Incremental Keccak-256 over OpenSSL's "KECCAK-256" digest.
class hasher final {
 public:
  hasher();

  hasher& update(const courier::schema::bytes_view_t& bytes);
  hasher& update(const std::string_view& str);

  /// The hasher is reset afterwards.
  courier::schema::hash32_t finalize();

 private:
  void reset();

  courier::crypto::openssl::evp_md_ptr digest_;
  courier::crypto::openssl::evp_md_ctx_ptr context_;
};

courier::schema::hash32_t hash(const std::string_view& str);
courier::schema::hash32_t hash(const courier::schema::bytes_view_t& bytes);

}  // namespace courier::keccak
