#pragma once
#include <courier/schema/primitives.hpp>
#include <optional>
#include <span>

namespace courier::schema::encoding {

// Build-time selection of the binary codec. Callers hold an
// `encoder<Library>` and never touch the codec library directly.
template <typename Library>
struct encoder {
  template <typename T>
  courier::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, courier::schema::bytes_t& out);

  template <typename T>
  T decode(const courier::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const courier::schema::bytes_view_t& bytes);
};

}  // namespace courier::schema::encoding
