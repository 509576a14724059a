#include <array>
#include <courier/eip712/digest.hpp>
#include <courier/keccak/hash.hpp>

namespace courier::eip712 {

courier::schema::hash32_t digest(
    const courier::schema::hash32_t& domain_separator,
    const courier::schema::hash32_t& struct_hash) {
  static constexpr auto kPrefix = std::array<uint8_t, 2>{0x19, 0x01};
  auto hasher = courier::keccak::hasher{};
  hasher.update(courier::schema::bytes_view_t{kPrefix});
  hasher.update(courier::schema::bytes_view_t{domain_separator});
  hasher.update(courier::schema::bytes_view_t{struct_hash});
  return hasher.finalize();
}

}  // namespace courier::eip712
