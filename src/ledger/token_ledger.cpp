#include <spdlog/spdlog.h>
#include <courier/common/critical.hpp>
#include <courier/ledger/token_ledger.hpp>
#include <courier/schema/key/engine_keys.hpp>

using namespace courier::schema;

namespace courier::ledger {

token_ledger::token_ledger(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void token_ledger::open(const std::optional<token_config_t>& genesis) {
  auto config_key = key::make_token_config_key(encoder_);
  auto persisted = storage_.get<token_config_t>(encoder_, config_key);
  if (persisted) {
    if (genesis && !(*genesis == *persisted)) {
      spdlog::error("Persisted token '{}' does not match configured token '{}'",
                    persisted->name, genesis->name);
      courier::common::critical("token configuration conflicts with state");
    }
    config_ = std::move(persisted);
    spdlog::info("Loaded token '{}' ({}) with total supply {}", config_->name,
                 config_->symbol, total_supply().str());
    return;
  }
  if (!genesis) {
    courier::common::critical("no persisted token and no genesis config");
  }
  mint_genesis(*genesis);
}

void token_ledger::mint_genesis(const token_config_t& genesis) {
  if (is_zero(genesis.initial_holder) && genesis.total_supply != 0) {
    courier::common::critical("genesis supply minted to the zero address");
  }
  auto batch = write_batch_t{storage_};
  batch.put(encoder_, key::make_token_config_key(encoder_), genesis);
  batch.put(encoder_, key::make_total_supply_key(encoder_),
            genesis.total_supply);
  batch.put(encoder_, key::make_balance_key(encoder_, genesis.initial_holder),
            genesis.total_supply);
  storage_.commit(batch);
  config_ = genesis;
  spdlog::info("Minted genesis supply {} of '{}' to {}",
               genesis.total_supply.str(), genesis.name,
               to_hex(genesis.initial_holder));
}

const token_config_t& token_ledger::config() const {
  if (!config_) {
    courier::common::critical("token ledger used before open");
  }
  return *config_;
}

amount_t token_ledger::balance_of(const address_t& holder) const {
  return storage_
      .get<amount_t>(encoder_, key::make_balance_key(encoder_, holder))
      .value_or(amount_t{0});
}

amount_t token_ledger::balance_of(const write_batch_t& batch,
                                  const address_t& holder) const {
  return batch.get<amount_t>(encoder_, key::make_balance_key(encoder_, holder))
      .value_or(amount_t{0});
}

amount_t token_ledger::total_supply() const {
  return storage_.get<amount_t>(encoder_, key::make_total_supply_key(encoder_))
      .value_or(amount_t{0});
}

transfer_outcome_t token_ledger::transfer(write_batch_t& batch,
                                          const address_t& from,
                                          const address_t& to,
                                          const amount_t& value) const {
  if (is_zero(from)) {
    return transaction_error_code::transfer_from_zero_address;
  }
  if (is_zero(to)) {
    return transaction_error_code::transfer_to_zero_address;
  }
  auto from_balance = balance_of(batch, from);
  if (from_balance < value) {
    spdlog::debug("Transfer of {} from {} rejected, balance {}", value.str(),
                  to_hex(from), from_balance.str());
    return transaction_error_code::insufficient_balance;
  }
  if (from != to) {
    auto to_balance = balance_of(batch, to);
    batch.put(encoder_, key::make_balance_key(encoder_, from),
              amount_t{from_balance - value});
    batch.put(encoder_, key::make_balance_key(encoder_, to),
              amount_t{to_balance + value});
  }
  return make_transfer_event(from, to, value);
}

transaction_event_t make_transfer_event(const address_t& from,
                                        const address_t& to,
                                        const amount_t& value) {
  return transaction_event_t{
      .type = std::string{kTransferEvent},
      .attributes = {
          transaction_event_attribute_t{
              .key = "from", .value = to_hex(from), .index = true},
          transaction_event_attribute_t{
              .key = "to", .value = to_hex(to), .index = true},
          transaction_event_attribute_t{
              .key = "value", .value = value.str(), .index = false}}};
}

}  // namespace courier::ledger
