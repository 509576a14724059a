#include <spdlog/spdlog.h>
#include <courier/crypto/recover.hpp>
#include <courier/eip712/digest.hpp>
#include <courier/eip712/domain.hpp>
#include <courier/eip712/struct_hash.hpp>
#include <courier/execution/engine.hpp>
#include <courier/execution/envelope.hpp>
#include <courier/schema/key/engine_keys.hpp>
#include <courier/schema/encoding/scale/encoder.hpp>
#include <courier/schema/encoding/scale/transaction.hpp>
#include <exception>
#include <string>
#include <tuple>
#include <utility>

using namespace courier::schema;

namespace {

using encoder_t = courier::schema::encoding::encoder<
    courier::schema::encoding::scale_encoder_tag>;

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  try {
    auto encoder = encoder_t{};
    auto tx = encoder.try_decode<transaction_t>(raw_tx);
    if (!tx) {
      error = "malformed transaction envelope";
    }
    return tx;
  } catch (const std::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

uint16_t payload_version(const transaction_payload_t& payload) {
  return std::visit([](const auto& value) { return value.version; }, payload);
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       const std::string_view codespace,
                                       std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{message(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                const std::string_view log,
                                const bytes_view_t& key) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.key = make_bytes(key);
  result.codespace = std::string{courier::execution::kQueryCodespace};
  return result;
}

transaction_event_t make_authorization_event(const std::string_view type,
                                             const address_t& authorizer,
                                             const nonce_t& nonce) {
  return transaction_event_t{
      .type = std::string{type},
      .attributes = {transaction_event_attribute_t{
                         .key = "authorizer",
                         .value = to_hex(authorizer),
                         .index = true},
                     transaction_event_attribute_t{.key = "nonce",
                                                   .value = to_hex(nonce),
                                                   .index = true}}};
}

}  // namespace

namespace courier::execution {

transaction_event_t make_authorization_used_event(const address_t& authorizer,
                                                  const nonce_t& nonce) {
  return make_authorization_event(kAuthorizationUsedEvent, authorizer, nonce);
}

transaction_event_t make_authorization_canceled_event(
    const address_t& authorizer,
    const nonce_t& nonce) {
  return make_authorization_event(kAuthorizationCanceledEvent, authorizer,
                                  nonce);
}

engine::engine(encoder_t& encoder,
               storage_t& storage,
               const std::optional<token_config_t>& genesis,
               time_source_t time_source)
    : encoder_{encoder},
      storage_{storage},
      ledger_{encoder, storage},
      registry_{encoder, storage},
      time_source_{std::move(time_source)},
      signature_recoverer_{&courier::crypto::recover_address} {
  auto lock = std::scoped_lock{mutex_};
  if (!time_source_) {
    time_source_ = system_time_source();
  }
  ledger_.open(genesis);
  domain_separator_ =
      courier::eip712::bind(courier::eip712::make_domain(ledger_.config()));
  if (!courier::crypto::available()) {
    spdlog::warn("OpenSSL does not expose secp256k1; every signature will be "
                 "rejected");
  }
  spdlog::info("Authorization engine ready for '{}' on chain {} at {}",
               ledger_.config().name, ledger_.config().chain_id.str(),
               to_hex(ledger_.config().verifying_contract));
  spdlog::debug("EIP-712 domain separator {}", to_hex(domain_separator_));
}

transaction_result_t engine::transfer_with_authorization(
    const transfer_with_authorization_t& authorization) {
  auto lock = std::scoped_lock{mutex_};
  auto batch = write_batch_t{storage_};
  return commit_if_ok(batch, apply_payment(batch, authorization));
}

transaction_result_t engine::receive_with_authorization(
    const address_t& caller,
    const receive_with_authorization_t& authorization) {
  auto lock = std::scoped_lock{mutex_};
  if (caller != authorization.to) {
    spdlog::debug("Receive authorization {} submitted by {} instead of {}",
                  to_hex(authorization.nonce), to_hex(caller),
                  to_hex(authorization.to));
    return make_error_result(transaction_error_code::caller_not_payee,
                             kAuthorizationCodespace);
  }
  auto batch = write_batch_t{storage_};
  return commit_if_ok(batch, apply_payment(batch, authorization));
}

transaction_result_t engine::cancel_authorization(
    const cancel_authorization_t& cancellation) {
  auto lock = std::scoped_lock{mutex_};
  auto batch = write_batch_t{storage_};
  return commit_if_ok(batch, apply_cancellation(batch, cancellation));
}

transaction_result_t engine::transfer(const address_t& caller,
                                      const token_transfer_t& transfer) {
  auto lock = std::scoped_lock{mutex_};
  auto batch = write_batch_t{storage_};
  return commit_if_ok(batch, apply_transfer(batch, caller, transfer));
}

std::optional<transaction_t> engine::validate_envelope(
    const bytes_view_t& raw_tx,
    transaction_result_t& rejection) const {
  auto decode_error = std::string{};
  auto tx = decode_transaction(raw_tx, decode_error);
  if (!tx) {
    rejection = make_error_result(transaction_error_code::invalid_transaction,
                                  kTransactionCodespace, decode_error);
    return std::nullopt;
  }
  if (tx->version != 1) {
    rejection = make_error_result(
        transaction_error_code::unsupported_transaction_version,
        kTransactionCodespace, "expected envelope version 1");
    return std::nullopt;
  }
  if (payload_version(tx->payload) != 1) {
    rejection = make_error_result(
        transaction_error_code::unsupported_transaction_version,
        kTransactionCodespace, "expected payload version 1");
    return std::nullopt;
  }
  if (tx->chain_id != ledger_.config().chain_id) {
    rejection = make_error_result(transaction_error_code::invalid_chain_id,
                                  kTransactionCodespace,
                                  "expected chain id " +
                                      ledger_.config().chain_id.str());
    return std::nullopt;
  }
  auto digest = envelope_digest(domain_separator_, *tx);
  if (!signed_by(digest, tx->signer, tx->signature)) {
    spdlog::debug("Envelope claiming signer {} failed signature recovery",
                  to_hex(tx->signer));
    rejection = make_error_result(
        transaction_error_code::invalid_transaction_signature,
        kTransactionCodespace);
    return std::nullopt;
  }
  auto expected_nonce = envelope_nonce_of(tx->signer) + 1;
  if (tx->nonce != expected_nonce) {
    rejection = make_error_result(
        transaction_error_code::invalid_transaction_nonce,
        kTransactionCodespace,
        "expected nonce " + std::to_string(expected_nonce));
    return std::nullopt;
  }
  return tx;
}

transaction_result_t engine::check_transaction(
    const bytes_view_t& raw_tx) const {
  auto lock = std::scoped_lock{mutex_};
  auto rejection = transaction_result_t{};
  if (!validate_envelope(raw_tx, rejection)) {
    return rejection;
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto rejection = transaction_result_t{};
  auto tx = validate_envelope(raw_tx, rejection);
  if (!tx) {
    return rejection;
  }
  return execute_operation(*tx);
}

uint64_t engine::envelope_nonce(const address_t& signer) const {
  auto lock = std::scoped_lock{mutex_};
  return envelope_nonce_of(signer);
}

uint64_t engine::envelope_nonce_of(const address_t& signer) const {
  return storage_.get<uint64_t>(encoder_, key::make_nonce_key(encoder_, signer))
      .value_or(0);
}

transaction_result_t engine::execute_operation(const transaction_t& tx) {
  auto batch = write_batch_t{storage_};
  auto result = dispatch(batch, tx);
  if (result.code != 0) {
    // The payload's staged writes are dropped with `batch`.
    auto nonce_batch = write_batch_t{storage_};
    stage_envelope_nonce(nonce_batch, tx);
    storage_.commit(nonce_batch);
    return result;
  }
  stage_envelope_nonce(batch, tx);
  storage_.commit(batch);
  return result;
}

transaction_result_t engine::dispatch(write_batch_t& batch,
                                      const transaction_t& tx) {
  return std::visit(
      overloaded{
          [&](const transfer_with_authorization_t& value) {
            return apply_payment(batch, value);
          },
          [&](const receive_with_authorization_t& value) {
            if (tx.signer != value.to) {
              return make_error_result(transaction_error_code::caller_not_payee,
                                       kAuthorizationCodespace);
            }
            return apply_payment(batch, value);
          },
          [&](const cancel_authorization_t& value) {
            return apply_cancellation(batch, value);
          },
          [&](const token_transfer_t& value) {
            return apply_transfer(batch, tx.signer, value);
          }},
      tx.payload);
}

void engine::stage_envelope_nonce(write_batch_t& batch,
                                  const transaction_t& tx) {
  batch.put(encoder_, key::make_nonce_key(encoder_, tx.signer), tx.nonce);
}

transaction_result_t engine::commit_if_ok(write_batch_t& batch,
                                          transaction_result_t result) {
  if (result.code == 0) {
    storage_.commit(batch);
  }
  return result;
}

template <typename Message>
transaction_result_t engine::apply_payment(write_batch_t& batch,
                                           const Message& authorization) {
  if (registry_.used(batch, authorization.from, authorization.nonce)) {
    return make_error_result(transaction_error_code::authorization_already_used,
                             kAuthorizationCodespace);
  }

  auto now = uint256_t{time_source_()};
  if (now < authorization.valid_after) {
    return make_error_result(
        transaction_error_code::authorization_not_yet_valid,
        kAuthorizationCodespace);
  }
  if (now >= authorization.valid_before) {
    return make_error_result(transaction_error_code::authorization_expired,
                             kAuthorizationCodespace);
  }

  auto digest = courier::eip712::digest(
      domain_separator_, courier::eip712::struct_hash(authorization));
  if (!signed_by(digest, authorization.from, authorization.signature)) {
    return make_error_result(transaction_error_code::invalid_signature,
                             kAuthorizationCodespace);
  }

  registry_.stage(batch, authorization.from, authorization.nonce,
                  authorization_status_t::used);
  auto outcome = ledger_.transfer(batch, authorization.from, authorization.to,
                                  authorization.value);
  if (const auto* code = std::get_if<transaction_error_code>(&outcome)) {
    return make_error_result(*code, kLedgerCodespace);
  }

  spdlog::info("Authorization {} of {} used: {} to {}",
               to_hex(authorization.nonce), to_hex(authorization.from),
               authorization.value.str(), to_hex(authorization.to));

  auto result = transaction_result_t{};
  result.events.push_back(
      make_authorization_used_event(authorization.from, authorization.nonce));
  result.events.push_back(std::get<transaction_event_t>(std::move(outcome)));
  return result;
}

transaction_result_t engine::apply_cancellation(
    write_batch_t& batch,
    const cancel_authorization_t& cancellation) {
  if (registry_.used(batch, cancellation.authorizer, cancellation.nonce)) {
    return make_error_result(transaction_error_code::authorization_already_used,
                             kAuthorizationCodespace);
  }

  auto digest = courier::eip712::digest(
      domain_separator_, courier::eip712::struct_hash(cancellation));
  if (!signed_by(digest, cancellation.authorizer, cancellation.signature)) {
    return make_error_result(transaction_error_code::invalid_signature,
                             kAuthorizationCodespace);
  }

  registry_.stage(batch, cancellation.authorizer, cancellation.nonce,
                  authorization_status_t::canceled);
  spdlog::info("Authorization {} of {} canceled", to_hex(cancellation.nonce),
               to_hex(cancellation.authorizer));

  auto result = transaction_result_t{};
  result.events.push_back(make_authorization_canceled_event(
      cancellation.authorizer, cancellation.nonce));
  return result;
}

transaction_result_t engine::apply_transfer(write_batch_t& batch,
                                            const address_t& caller,
                                            const token_transfer_t& transfer) {
  auto outcome = ledger_.transfer(batch, caller, transfer.to, transfer.value);
  if (const auto* code = std::get_if<transaction_error_code>(&outcome)) {
    return make_error_result(*code, kLedgerCodespace);
  }

  auto result = transaction_result_t{};
  result.events.push_back(std::get<transaction_event_t>(std::move(outcome)));
  return result;
}

bool engine::signed_by(const hash32_t& digest,
                       const address_t& expected,
                       const secp256k1_signature_t& signature) const {
  if (!signature_recoverer_) {
    return false;
  }
  auto recovered = signature_recoverer_(digest, signature);
  if (!recovered || is_zero(*recovered)) {
    return false;
  }
  return *recovered == expected;
}

bool engine::authorization_state(const address_t& authorizer,
                                 const nonce_t& nonce) const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.used(authorizer, nonce);
}

authorization_status_t engine::authorization_status(
    const address_t& authorizer,
    const nonce_t& nonce) const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.status(authorizer, nonce);
}

amount_t engine::balance_of(const address_t& holder) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.balance_of(holder);
}

amount_t engine::total_supply() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.total_supply();
}

token_config_t engine::token_config() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.config();
}

hash32_t engine::domain_separator() const {
  auto lock = std::scoped_lock{mutex_};
  return domain_separator_;
}

type_hashes_t engine::type_hashes() const {
  return type_hashes_t{
      .transfer_with_authorization =
          courier::eip712::transfer_with_authorization_typehash(),
      .receive_with_authorization =
          courier::eip712::receive_with_authorization_typehash(),
      .cancel_authorization = courier::eip712::cancel_authorization_typehash()};
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto info = app_info_t{};
  info.token_name = ledger_.config().name;
  info.token_symbol = ledger_.config().symbol;
  info.domain_separator = domain_separator_;
  return info;
}

query_result_t engine::query(std::string_view path,
                             const bytes_view_t& data) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.codespace = std::string{kQueryCodespace};

  if (path == "/authorization/state") {
    auto key = encoder_.try_decode<std::tuple<address_t, nonce_t>>(data);
    if (!key) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE (address, nonce)", data);
    }
    auto status = registry_.status(std::get<0>(*key), std::get<1>(*key));
    result.value = encoder_.encode(status);
    result.info = std::string{to_string(status)};
    return result;
  }
  if (path == "/ledger/balance") {
    auto holder = encoder_.try_decode<address_t>(data);
    if (!holder) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE address", data);
    }
    auto balance = ledger_.balance_of(*holder);
    result.value = encoder_.encode(balance);
    result.info = balance.str();
    return result;
  }
  if (path == "/account/nonce") {
    auto signer = encoder_.try_decode<address_t>(data);
    if (!signer) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE address", data);
    }
    auto nonce = envelope_nonce_of(*signer);
    result.value = encoder_.encode(nonce);
    result.info = std::to_string(nonce);
    return result;
  }
  if (path == "/token/config") {
    result.value = encoder_.encode(ledger_.config());
    return result;
  }
  if (path == "/eip712/domain_separator") {
    result.value = encoder_.encode(domain_separator_);
    result.info = to_hex(domain_separator_);
    return result;
  }
  if (path == "/eip712/type_hashes") {
    auto hashes = type_hashes();
    result.value =
        encoder_.encode(std::tuple{hashes.transfer_with_authorization,
                                   hashes.receive_with_authorization,
                                   hashes.cancel_authorization});
    return result;
  }
  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", data);
}

void engine::set_time_source(time_source_t time_source) {
  auto lock = std::scoped_lock{mutex_};
  if (!time_source) {
    spdlog::debug("Empty time source, using the system clock");
    time_source = system_time_source();
  }
  time_source_ = std::move(time_source);
}

void engine::set_signature_recoverer(signature_recoverer_t recoverer) {
  auto lock = std::scoped_lock{mutex_};
  if (!recoverer) {
    spdlog::debug("Empty signature recoverer, using OpenSSL recovery");
    recoverer = &courier::crypto::recover_address;
  }
  signature_recoverer_ = std::move(recoverer);
}

}  // namespace courier::execution
