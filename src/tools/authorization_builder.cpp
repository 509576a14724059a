#include <boost/program_options.hpp>
#include <courier/common/critical.hpp>
#include <courier/crypto/sign.hpp>
#include <courier/eip712/digest.hpp>
#include <courier/eip712/domain.hpp>
#include <courier/eip712/struct_hash.hpp>
#include <courier/execution/envelope.hpp>
#include <courier/schema/encoding/scale/encoder.hpp>
#include <courier/schema/transaction.hpp>

#include <iostream>
#include <limits>
#include <optional>
#include <utility>
#include <string>
#include <tuple>

namespace {

using encoder_t = courier::schema::encoding::encoder<
    courier::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;
using namespace courier::schema;

std::string get_string(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    std::cerr << "missing --" << name << '\n';
    courier::common::critical("missing required argument");
  }
  return vm[name].as<std::string>();
}

address_t get_address(const po::variables_map& vm, const std::string& name) {
  auto address = try_make_address(get_string(vm, name));
  if (!address) {
    std::cerr << "--" << name << " must be a 20-byte hex address\n";
    courier::common::critical("invalid address argument");
  }
  return *address;
}

hash32_t get_hash32(const po::variables_map& vm, const std::string& name) {
  auto hash = try_make_hash32(get_string(vm, name));
  if (!hash) {
    std::cerr << "--" << name << " must be 32 bytes of hex\n";
    courier::common::critical("invalid hash argument");
  }
  return *hash;
}

uint256_t get_uint256(const po::variables_map& vm, const std::string& name) {
  auto value = try_parse_uint256(get_string(vm, name));
  if (!value) {
    std::cerr << "--" << name << " must be a decimal, 0x hex or max\n";
    courier::common::critical("invalid integer argument");
  }
  return *value;
}

uint64_t get_uint64(const po::variables_map& vm, const std::string& name) {
  auto value = get_uint256(vm, name);
  if (value > std::numeric_limits<uint64_t>::max()) {
    std::cerr << "--" << name << " must fit in 64 bits\n";
    courier::common::critical("integer argument out of range");
  }
  return static_cast<uint64_t>(value);
}

courier::eip712::domain_t make_domain(const po::variables_map& vm) {
  return courier::eip712::domain_t{
      .name = get_string(vm, "name"),
      .version = get_string(vm, "eip712-version"),
      .chain_id = get_uint256(vm, "chain-id"),
      .verifying_contract = get_address(vm, "verifying-contract")};
}

template <typename Message>
secp256k1_signature_t sign(const po::variables_map& vm,
                           const Message& message) {
  auto digest =
      courier::eip712::digest(courier::eip712::bind(make_domain(vm)),
                              courier::eip712::struct_hash(message));
  if (vm.contains("print-digest")) {
    std::cerr << to_hex(digest) << '\n';
  }
  auto signature =
      courier::crypto::sign_digest(digest, get_hash32(vm, "private-key"));
  if (!signature) {
    courier::common::critical("failed to sign authorization");
  }
  return *signature;
}

address_t address_of(const hash32_t& private_key) {
  auto address = courier::crypto::address_from_private_key(private_key);
  if (!address) {
    courier::common::critical("private key is not a valid secp256k1 scalar");
  }
  return *address;
}

address_t signer_address(const po::variables_map& vm) {
  return address_of(get_hash32(vm, "private-key"));
}

/// Key that signs the envelope: `--relayer-key`, else `--private-key`.
hash32_t relayer_key(const po::variables_map& vm) {
  return vm.contains("relayer-key") ? get_hash32(vm, "relayer-key")
                                    : get_hash32(vm, "private-key");
}

/// Wrap `payload` in an envelope signed by `key`, printed as base64 SCALE.
std::string sign_envelope(const po::variables_map& vm,
                          const hash32_t& key,
                          transaction_payload_t payload) {
  auto tx = transaction_t{};
  tx.chain_id = get_uint256(vm, "chain-id");
  tx.nonce = get_uint64(vm, "envelope-nonce");
  tx.signer = address_of(key);
  tx.payload = std::move(payload);
  auto digest = courier::execution::envelope_digest(
      courier::eip712::bind(make_domain(vm)), tx);
  auto signature = courier::crypto::sign_digest(digest, key);
  if (!signature) {
    courier::common::critical("failed to sign transaction envelope");
  }
  tx.signature = *signature;
  auto encoder = encoder_t{};
  return to_base64(encoder.encode(tx));
}

template <typename Message>
Message make_payment(const po::variables_map& vm) {
  auto message = Message{};
  message.from = signer_address(vm);
  message.to = get_address(vm, "to");
  message.value = get_uint256(vm, "value");
  message.valid_after = get_uint256(vm, "valid-after");
  message.valid_before = get_uint256(vm, "valid-before");
  message.nonce = get_hash32(vm, "nonce");
  message.signature = sign(vm, message);
  return message;
}

bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = get_string(vm, "path");
  if (path == "/authorization/state") {
    return encoder.encode(
        std::tuple{get_address(vm, "authorizer"), get_hash32(vm, "nonce")});
  }
  if (path == "/ledger/balance") {
    return encoder.encode(get_address(vm, "holder"));
  }
  if (path == "/account/nonce") {
    return encoder.encode(get_address(vm, "account"));
  }
  if (path == "/token/config" || path == "/eip712/domain_separator" ||
      path == "/eip712/type_hashes") {
    return {};
  }
  courier::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  authorization_builder transfer|receive [options]\n"
            << "  authorization_builder cancel [options]\n"
            << "  authorization_builder token-transfer [options]\n"
            << "  authorization_builder address --private-key <hex>\n"
            << "  authorization_builder domain-separator [domain options]\n"
            << "  authorization_builder type-hashes\n"
            << "  authorization_builder query-key --path <route> [options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"authorization_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transfer|receive|cancel|token-transfer|address|domain-separator|"
      "type-hashes|query-key")(
      "private-key", po::value<std::string>(), "signer secp256k1 key hex")(
      "name", po::value<std::string>(), "EIP-712 domain name")(
      "eip712-version", po::value<std::string>()->default_value("1"),
      "EIP-712 domain version")(
      "chain-id", po::value<std::string>()->default_value("1"),
      "EIP-712 chain id")(
      "verifying-contract",
      po::value<std::string>()->default_value(
          "0x0000000000000000000000000000000000000000"),
      "EIP-712 verifying contract")("to", po::value<std::string>(),
                                    "payee address")(
      "value", po::value<std::string>(), "amount in the smallest unit")(
      "valid-after", po::value<std::string>()->default_value("0"),
      "inclusive lower bound, Unix seconds")(
      "valid-before", po::value<std::string>()->default_value("max"),
      "exclusive upper bound, Unix seconds")(
      "nonce", po::value<std::string>(), "32-byte authorization nonce hex")(
      "relayer-key", po::value<std::string>(),
      "envelope signer key hex, defaults to --private-key")(
      "envelope-nonce", po::value<std::string>()->default_value("1"),
      "envelope sequence number of the relayer")(
      "path", po::value<std::string>(), "query route")(
      "authorizer", po::value<std::string>(), "authorizer address")(
      "holder", po::value<std::string>(), "balance holder address")(
      "account", po::value<std::string>(), "envelope signer address")(
      "print-digest", "write the signed digest to stderr");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transfer") {
    auto message = make_payment<transfer_with_authorization_t>(vm);
    std::cout << sign_envelope(vm, relayer_key(vm), message) << '\n';
    return 0;
  }

  if (command == "receive") {
    // Only the payee may submit, so `--relayer-key` is normally the payee's.
    auto message = make_payment<receive_with_authorization_t>(vm);
    std::cout << sign_envelope(vm, relayer_key(vm), message) << '\n';
    return 0;
  }

  if (command == "cancel") {
    auto message = cancel_authorization_t{};
    message.authorizer = signer_address(vm);
    message.nonce = get_hash32(vm, "nonce");
    message.signature = sign(vm, message);
    std::cout << sign_envelope(vm, relayer_key(vm), message) << '\n';
    return 0;
  }

  if (command == "token-transfer") {
    auto payload = token_transfer_t{.to = get_address(vm, "to"),
                                    .value = get_uint256(vm, "value")};
    std::cout << sign_envelope(vm, get_hash32(vm, "private-key"), payload)
              << '\n';
    return 0;
  }

  if (command == "address") {
    std::cout << to_hex(signer_address(vm)) << '\n';
    return 0;
  }

  if (command == "domain-separator") {
    std::cout << to_hex(courier::eip712::bind(make_domain(vm))) << '\n';
    return 0;
  }

  if (command == "type-hashes") {
    std::cout << "transfer_with_authorization "
              << to_hex(courier::eip712::transfer_with_authorization_typehash())
              << '\n'
              << "receive_with_authorization "
              << to_hex(courier::eip712::receive_with_authorization_typehash())
              << '\n'
              << "cancel_authorization "
              << to_hex(courier::eip712::cancel_authorization_typehash())
              << '\n';
    return 0;
  }

  if (command == "query-key") {
    std::cout << to_base64(build_query_key(vm)) << '\n';
    return 0;
  }

  courier::common::critical(
      "command must be transfer|receive|cancel|token-transfer|address|"
      "domain-separator|type-hashes|query-key");
}
