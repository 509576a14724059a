#include <courier/common/critical.hpp>
#include <courier/keccak/hash.hpp>

namespace courier::keccak {

hasher::hasher()
    : digest_{EVP_MD_fetch(nullptr, "KECCAK-256", nullptr), EVP_MD_free},
      context_{EVP_MD_CTX_new(), EVP_MD_CTX_free} {
  if (!digest_) {
    courier::common::critical("OpenSSL does not provide KECCAK-256");
  }
  if (!context_) {
    courier::common::critical("failed to allocate digest context");
  }
  reset();
}

void hasher::reset() {
  if (EVP_DigestInit_ex2(context_.get(), digest_.get(), nullptr) != 1) {
    courier::common::critical("failed to initialize KECCAK-256");
  }
}

hasher& hasher::update(const courier::schema::bytes_view_t& bytes) {
  if (bytes.empty()) {
    return *this;
  }
  if (EVP_DigestUpdate(context_.get(), bytes.data(), bytes.size()) != 1) {
    courier::common::critical("failed to update KECCAK-256");
  }
  return *this;
}

hasher& hasher::update(const std::string_view& str) {
  return update(courier::schema::make_bytes_view(str));
}

courier::schema::hash32_t hasher::finalize() {
  auto output = courier::schema::hash32_t{};
  auto size = 0u;
  if (EVP_DigestFinal_ex(context_.get(), output.data(), &size) != 1 ||
      size != output.size()) {
    courier::common::critical("failed to finalize KECCAK-256");
  }
  reset();
  return output;
}

courier::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

courier::schema::hash32_t hash(const courier::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace courier::keccak
