#include <spdlog/spdlog.h>
#include <courier/common/critical.hpp>
#include <courier/execution/nonce_registry.hpp>
#include <courier/schema/key/engine_keys.hpp>

using namespace courier::schema;

namespace courier::execution {

nonce_registry::nonce_registry(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

authorization_status_t nonce_registry::status(const address_t& authorizer,
                                              const nonce_t& nonce) const {
  return storage_
      .get<authorization_status_t>(
          encoder_, key::make_authorization_key(encoder_, authorizer, nonce))
      .value_or(authorization_status_t::unused);
}

authorization_status_t nonce_registry::status(const write_batch_t& batch,
                                              const address_t& authorizer,
                                              const nonce_t& nonce) const {
  return batch
      .get<authorization_status_t>(
          encoder_, key::make_authorization_key(encoder_, authorizer, nonce))
      .value_or(authorization_status_t::unused);
}

bool nonce_registry::used(const address_t& authorizer,
                          const nonce_t& nonce) const {
  return status(authorizer, nonce) != authorization_status_t::unused;
}

bool nonce_registry::used(const write_batch_t& batch,
                          const address_t& authorizer,
                          const nonce_t& nonce) const {
  return status(batch, authorizer, nonce) != authorization_status_t::unused;
}

void nonce_registry::stage(write_batch_t& batch,
                           const address_t& authorizer,
                           const nonce_t& nonce,
                           authorization_status_t status) const {
  if (status == authorization_status_t::unused) {
    courier::common::critical("authorization status cannot be reset");
  }
  if (used(batch, authorizer, nonce)) {
    spdlog::error("Authorization {} of {} is already consumed", to_hex(nonce),
                  to_hex(authorizer));
    courier::common::critical("authorization status is monotonic");
  }
  batch.put(encoder_, key::make_authorization_key(encoder_, authorizer, nonce),
            status);
}

}  // namespace courier::execution
