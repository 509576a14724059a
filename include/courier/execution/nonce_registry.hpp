#pragma once

#include <courier/schema/authorization_status.hpp>
#include <courier/schema/encoding/scale/encoder.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/storage/rocksdb/storage.hpp>

namespace courier::execution {

/// Persistent set of consumed (authorizer, nonce) pairs.
///
/// Absent entries are `unused`. An entry only ever moves from `unused` to
/// `used` or `canceled` and is never removed.
class nonce_registry final {
 public:
  using encoder_t = courier::schema::encoding::encoder<
      courier::schema::encoding::scale_encoder_tag>;
  using storage_t =
      courier::storage::storage<courier::storage::rocksdb_storage_tag>;
  using write_batch_t =
      courier::storage::write_batch<courier::storage::rocksdb_storage_tag>;

  nonce_registry(encoder_t& encoder, storage_t& storage);

  courier::schema::authorization_status_t status(
      const courier::schema::address_t& authorizer,
      const courier::schema::nonce_t& nonce) const;
  courier::schema::authorization_status_t status(
      const write_batch_t& batch,
      const courier::schema::address_t& authorizer,
      const courier::schema::nonce_t& nonce) const;

  bool used(const courier::schema::address_t& authorizer,
            const courier::schema::nonce_t& nonce) const;
  bool used(const write_batch_t& batch,
            const courier::schema::address_t& authorizer,
            const courier::schema::nonce_t& nonce) const;

  /// Record a terminal status in `batch`. Staging `unused`, or overwriting an
  /// entry that is already consumed, is fatal.
  void stage(write_batch_t& batch,
             const courier::schema::address_t& authorizer,
             const courier::schema::nonce_t& nonce,
             courier::schema::authorization_status_t status) const;

 private:
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace courier::execution
