#pragma once
#include <courier/common/critical.hpp>
#include <courier/schema/encoding/encoder.hpp>
#include <courier/schema/encoding/scale/authorization_status.hpp>
#include <courier/schema/encoding/scale/cancel_authorization.hpp>
#include <courier/schema/encoding/scale/primitives.hpp>
#include <courier/schema/encoding/scale/receive_with_authorization.hpp>
#include <courier/schema/encoding/scale/token_config.hpp>
#include <courier/schema/encoding/scale/token_transfer.hpp>
#include <courier/schema/encoding/scale/transaction.hpp>
#include <courier/schema/encoding/scale/transfer_with_authorization.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace courier::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  courier::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, courier::schema::bytes_t& out);

  /// Decode trusted bytes; corrupt input is fatal.
  template <typename T>
  T decode(const courier::schema::bytes_view_t& bytes);

  /// Decode untrusted bytes.
  template <typename T>
  std::optional<T> try_decode(const courier::schema::bytes_view_t& bytes);
};

template <typename T>
courier::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    courier::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        courier::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const courier::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    courier::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const courier::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace courier::schema::encoding
