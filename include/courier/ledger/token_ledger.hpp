#pragma once

#include <courier/schema/encoding/scale/encoder.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/token_config.hpp>
#include <courier/schema/transaction_error_code.hpp>
#include <courier/schema/transaction_event.hpp>
#include <courier/storage/rocksdb/storage.hpp>
#include <optional>
#include <variant>

namespace courier::ledger {

using encoder_t = courier::schema::encoding::encoder<
    courier::schema::encoding::scale_encoder_tag>;
using storage_t =
    courier::storage::storage<courier::storage::rocksdb_storage_tag>;
using write_batch_t =
    courier::storage::write_batch<courier::storage::rocksdb_storage_tag>;

/// Either the `transfer` notification to emit or the reason for rejection.
using transfer_outcome_t =
    std::variant<courier::schema::transaction_event_t,
                 courier::schema::transaction_error_code>;

/// Fungible balance bookkeeping.
///
/// Mutations are only ever staged into a caller supplied batch so that the
/// caller decides whether they commit together with its own writes.
class token_ledger final {
 public:
  token_ledger(encoder_t& encoder, storage_t& storage);

  /// Load the persisted token config, or mint the genesis supply when the
  /// store is empty. A genesis that disagrees with persisted state, or no
  /// state and no genesis, is fatal.
  void open(const std::optional<courier::schema::token_config_t>& genesis);

  const courier::schema::token_config_t& config() const;

  courier::schema::amount_t balance_of(
      const courier::schema::address_t& holder) const;
  courier::schema::amount_t balance_of(
      const write_batch_t& batch,
      const courier::schema::address_t& holder) const;
  courier::schema::amount_t total_supply() const;

  transfer_outcome_t transfer(write_batch_t& batch,
                              const courier::schema::address_t& from,
                              const courier::schema::address_t& to,
                              const courier::schema::amount_t& value) const;

 private:
  void mint_genesis(const courier::schema::token_config_t& genesis);

  encoder_t& encoder_;
  storage_t& storage_;
  std::optional<courier::schema::token_config_t> config_;
};

courier::schema::transaction_event_t make_transfer_event(
    const courier::schema::address_t& from,
    const courier::schema::address_t& to,
    const courier::schema::amount_t& value);

}  // namespace courier::ledger
