#pragma once

#include <courier/execution/nonce_registry.hpp>
#include <courier/execution/signature_recoverer.hpp>
#include <courier/execution/time_source.hpp>
#include <courier/ledger/token_ledger.hpp>
#include <courier/schema/app_info.hpp>
#include <courier/schema/authorization_status.hpp>
#include <courier/schema/encoding/scale/encoder.hpp>
#include <courier/schema/primitives.hpp>
#include <courier/schema/query_result.hpp>
#include <courier/schema/token_config.hpp>
#include <courier/schema/transaction.hpp>
#include <courier/schema/transaction_error_code.hpp>
#include <courier/schema/transaction_event.hpp>
#include <courier/schema/transaction_result.hpp>
#include <courier/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>

namespace courier::execution {

inline constexpr auto kAuthorizationCodespace =
    std::string_view{"courier.authorization"};
inline constexpr auto kLedgerCodespace = std::string_view{"courier.ledger"};
inline constexpr auto kTransactionCodespace =
    std::string_view{"courier.transaction"};
inline constexpr auto kQueryCodespace = std::string_view{"courier.query"};

/// EIP-3009 type hashes, in transfer, receive, cancel order.
struct type_hashes_t final {
  courier::schema::hash32_t transfer_with_authorization;
  courier::schema::hash32_t receive_with_authorization;
  courier::schema::hash32_t cancel_authorization;
};

/// Relayed authorization state machine.
///
/// Each operation validates its signed message, then stages the nonce
/// registry write and the ledger mutation in one write batch. The batch is
/// committed only when every step succeeds; on any rejection it is dropped
/// and no state changes. One mutex serializes all operations.
class engine final {
 public:
  using encoder_t = courier::schema::encoding::encoder<
      courier::schema::encoding::scale_encoder_tag>;
  using storage_t =
      courier::storage::storage<courier::storage::rocksdb_storage_tag>;
  using write_batch_t =
      courier::storage::write_batch<courier::storage::rocksdb_storage_tag>;

  /// Open the ledger (minting `genesis` on an empty store) and bind the
  /// EIP-712 domain from the token config.
  explicit engine(
      encoder_t& encoder,
      storage_t& storage,
      const std::optional<courier::schema::token_config_t>& genesis =
          std::nullopt,
      time_source_t time_source = system_time_source());

  /// Move `value` from `from` to `to` on behalf of the signer. Any party may
  /// relay.
  courier::schema::transaction_result_t transfer_with_authorization(
      const courier::schema::transfer_with_authorization_t& authorization);

  /// Same as transfer, but only `authorization.to` may submit it. `caller`
  /// must already be authenticated by the host.
  courier::schema::transaction_result_t receive_with_authorization(
      const courier::schema::address_t& caller,
      const courier::schema::receive_with_authorization_t& authorization);

  courier::schema::transaction_result_t cancel_authorization(
      const courier::schema::cancel_authorization_t& cancellation);

  /// Plain ledger transfer by the caller. `caller` must already be
  /// authenticated by the host.
  courier::schema::transaction_result_t transfer(
      const courier::schema::address_t& caller,
      const courier::schema::token_transfer_t& transfer);

  /// Decode the envelope and check its versions, chain id, signer
  /// signature and nonce. Does not touch state.
  courier::schema::transaction_result_t check_transaction(
      const courier::schema::bytes_view_t& raw_tx) const;

  /// Validate a SCALE `transaction_t` envelope as `check_transaction` does,
  /// then dispatch its payload with the recovered signer as caller. Once the
  /// envelope is valid its nonce is consumed, even when the payload is
  /// rejected.
  courier::schema::transaction_result_t execute_transaction(
      const courier::schema::bytes_view_t& raw_tx);

  /// Last envelope nonce committed for `signer`, 0 when none was.
  uint64_t envelope_nonce(const courier::schema::address_t& signer) const;

  bool authorization_state(const courier::schema::address_t& authorizer,
                           const courier::schema::nonce_t& nonce) const;
  courier::schema::authorization_status_t authorization_status(
      const courier::schema::address_t& authorizer,
      const courier::schema::nonce_t& nonce) const;

  courier::schema::amount_t balance_of(
      const courier::schema::address_t& holder) const;
  courier::schema::amount_t total_supply() const;
  courier::schema::token_config_t token_config() const;

  courier::schema::hash32_t domain_separator() const;
  type_hashes_t type_hashes() const;

  courier::schema::app_info_t info() const;

  /// Read-path query by route. Unknown routes and malformed keys return a
  /// non-zero `query_error_code`.
  courier::schema::query_result_t query(
      std::string_view path,
      const courier::schema::bytes_view_t& data) const;

  /// An empty callable restores the system clock.
  void set_time_source(time_source_t time_source);
  /// An empty callable restores `crypto::recover_address`.
  void set_signature_recoverer(signature_recoverer_t recoverer);

 private:
  std::optional<courier::schema::transaction_t> validate_envelope(
      const courier::schema::bytes_view_t& raw_tx,
      courier::schema::transaction_result_t& rejection) const;

  courier::schema::transaction_result_t execute_operation(
      const courier::schema::transaction_t& tx);

  courier::schema::transaction_result_t dispatch(
      write_batch_t& batch,
      const courier::schema::transaction_t& tx);

  uint64_t envelope_nonce_of(const courier::schema::address_t& signer) const;

  void stage_envelope_nonce(write_batch_t& batch,
                            const courier::schema::transaction_t& tx);

  /// Commit `batch` when `result` succeeded; otherwise drop it.
  courier::schema::transaction_result_t commit_if_ok(
      write_batch_t& batch,
      courier::schema::transaction_result_t result);

  template <typename Message>
  courier::schema::transaction_result_t apply_payment(
      write_batch_t& batch,
      const Message& authorization);

  courier::schema::transaction_result_t apply_cancellation(
      write_batch_t& batch,
      const courier::schema::cancel_authorization_t& cancellation);

  courier::schema::transaction_result_t apply_transfer(
      write_batch_t& batch,
      const courier::schema::address_t& caller,
      const courier::schema::token_transfer_t& transfer);

  /// Recovered signer equals `expected`, and is not the zero address.
  bool signed_by(const courier::schema::hash32_t& digest,
                 const courier::schema::address_t& expected,
                 const courier::schema::secp256k1_signature_t& signature) const;

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  courier::ledger::token_ledger ledger_;
  nonce_registry registry_;
  courier::schema::hash32_t domain_separator_{};
  time_source_t time_source_;
  signature_recoverer_t signature_recoverer_;
};

courier::schema::transaction_event_t make_authorization_used_event(
    const courier::schema::address_t& authorizer,
    const courier::schema::nonce_t& nonce);

courier::schema::transaction_event_t make_authorization_canceled_event(
    const courier::schema::address_t& authorizer,
    const courier::schema::nonce_t& nonce);

}  // namespace courier::execution
