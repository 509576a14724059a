#include <gtest/gtest.h>
#include <courier/eip712/abi.hpp>
#include <courier/eip712/digest.hpp>
#include <courier/eip712/domain.hpp>
#include <courier/eip712/struct_hash.hpp>
#include <courier/keccak/hash.hpp>
#include <courier/testing/common.hpp>

#include <array>

using namespace courier::schema;

namespace {

courier::eip712::domain_t ether_mail_domain() {
  return courier::eip712::domain_t{
      .name = "Ether Mail",
      .version = "1",
      .chain_id = 1,
      .verifying_contract =
          make_address("0xCcCCccccCCCCcCCCCCCcCcCccCcCCCcCcccccccC")};
}

// Mail(Person from,Person to,string contents)Person(string name,address
// wallet) from the EIP-712 reference example.
hash32_t ether_mail_struct_hash() {
  auto person_type = courier::keccak::hash(
      std::string_view{"Person(string name,address wallet)"});
  auto mail_type = courier::keccak::hash(std::string_view{
      "Mail(Person from,Person to,string contents)Person(string name,address "
      "wallet)"});

  auto cow = std::array<courier::eip712::field_t, 2>{
      courier::eip712::abi::encode_string("Cow"),
      make_address("0xCD2a3d9F938E13CD947Ec05AbC7FE734Df8DD826")};
  auto bob = std::array<courier::eip712::field_t, 2>{
      courier::eip712::abi::encode_string("Bob"),
      make_address("0xbBbBBBBbbBBBbbbBbbBbbbbBBbBbbbbBbBbbBBbB")};
  auto mail = std::array<courier::eip712::field_t, 3>{
      courier::eip712::struct_hash(person_type, cow),
      courier::eip712::struct_hash(person_type, bob),
      courier::eip712::abi::encode_string("Hello, Bob!")};
  return courier::eip712::struct_hash(mail_type, mail);
}

}  // namespace

TEST(eip712_abi, address_is_left_padded) {
  auto word =
      courier::eip712::abi::encode_word(courier::testing::make_address(0xab));
  for (std::size_t i = 0; i < 12; ++i) {
    EXPECT_EQ(word[i], 0);
  }
  for (std::size_t i = 12; i < word.size(); ++i) {
    EXPECT_EQ(word[i], 0xab);
  }
}

TEST(eip712_abi, integer_is_big_endian) {
  auto word = courier::eip712::abi::encode_word(uint256_t{0x0102});
  EXPECT_EQ(word[30], 0x01);
  EXPECT_EQ(word[31], 0x02);
  EXPECT_EQ(word[0], 0x00);
}

TEST(eip712_domain, typehash_matches_reference) {
  EXPECT_EQ(to_hex(courier::eip712::domain_typehash()),
            "0x8b73c3c69bb8fe3d512ecc4cf759cc79"
            "239f7b179b0ffacaa9a75d522b39400f");
}

TEST(eip712_domain, ether_mail_domain_separator) {
  EXPECT_EQ(to_hex(courier::eip712::bind(ether_mail_domain())),
            "0xf2cee375fa42b42143804025fc449dea"
            "fd50cc031ca257e0b194a650a912090f");
}

TEST(eip712_struct_hash, ether_mail_struct_hash) {
  EXPECT_EQ(to_hex(ether_mail_struct_hash()),
            "0xc52c0ee5d84264471806290a3f2c4cec"
            "fc5490626bf912d01f240d7a274b371e");
}

TEST(eip712_digest, ether_mail_digest) {
  auto digest = courier::eip712::digest(
      courier::eip712::bind(ether_mail_domain()), ether_mail_struct_hash());
  EXPECT_EQ(to_hex(digest),
            "0xbe609aee343fb3c4b28e1df9e632fca6"
            "4fcfaede20f02e86244efddf30957bd2");
}

TEST(eip712_struct_hash, authorization_typehashes) {
  EXPECT_EQ(to_hex(courier::eip712::transfer_with_authorization_typehash()),
            "0x7c7c6cdb67a18743f49ec6fa9b35f50d"
            "52ed05cbed4cc592e13b44501c1a2267");
  EXPECT_EQ(to_hex(courier::eip712::receive_with_authorization_typehash()),
            "0xd099cc98ef71107a616c4f0f941f04c3"
            "22d8e254fe26b3c6668db87aae413de8");
  EXPECT_EQ(to_hex(courier::eip712::cancel_authorization_typehash()),
            "0x158b0a9edf7a828aad02f63cd515c68e"
            "f2f50ba807396f6d12842833a1597429");
}

TEST(eip712_struct_hash, typed_helper_matches_field_encoding) {
  auto message = transfer_with_authorization_t{};
  message.from = courier::testing::make_address(0x11);
  message.to = courier::testing::make_address(0x22);
  message.value = 7'000'000;
  message.valid_after = 0;
  message.valid_before = 1'800'000'000;
  message.nonce = courier::testing::make_hash(0x33);

  auto fields = std::array<courier::eip712::field_t, 6>{
      message.from,        message.to,           message.value,
      message.valid_after, message.valid_before, message.nonce};
  EXPECT_EQ(courier::eip712::struct_hash(message),
            courier::eip712::struct_hash(
                courier::eip712::transfer_with_authorization_typehash(),
                fields));
}

TEST(eip712_struct_hash, transfer_and_receive_differ_for_same_fields) {
  auto transfer = transfer_with_authorization_t{};
  transfer.from = courier::testing::make_address(0x11);
  transfer.to = courier::testing::make_address(0x22);
  transfer.value = 1;
  transfer.valid_before = 10;
  transfer.nonce = courier::testing::make_hash(0x01);

  auto receive = receive_with_authorization_t{};
  receive.from = transfer.from;
  receive.to = transfer.to;
  receive.value = transfer.value;
  receive.valid_before = transfer.valid_before;
  receive.nonce = transfer.nonce;

  EXPECT_NE(courier::eip712::struct_hash(transfer),
            courier::eip712::struct_hash(receive));
}

TEST(eip712_struct_hash, every_signed_field_changes_the_hash) {
  auto base = transfer_with_authorization_t{};
  base.from = courier::testing::make_address(0x11);
  base.to = courier::testing::make_address(0x22);
  base.value = 5;
  base.valid_after = 1;
  base.valid_before = 9;
  base.nonce = courier::testing::make_hash(0x01);
  auto reference = courier::eip712::struct_hash(base);

  auto changed = base;
  changed.from = courier::testing::make_address(0x12);
  EXPECT_NE(courier::eip712::struct_hash(changed), reference);
  changed = base;
  changed.to = courier::testing::make_address(0x23);
  EXPECT_NE(courier::eip712::struct_hash(changed), reference);
  changed = base;
  changed.value = 6;
  EXPECT_NE(courier::eip712::struct_hash(changed), reference);
  changed = base;
  changed.valid_after = 2;
  EXPECT_NE(courier::eip712::struct_hash(changed), reference);
  changed = base;
  changed.valid_before = 10;
  EXPECT_NE(courier::eip712::struct_hash(changed), reference);
  changed = base;
  changed.nonce = courier::testing::make_hash(0x02);
  EXPECT_NE(courier::eip712::struct_hash(changed), reference);

  // The signature is not part of the signed message.
  changed = base;
  changed.signature.v = 27;
  EXPECT_EQ(courier::eip712::struct_hash(changed), reference);
}

TEST(eip712_domain, every_domain_field_changes_the_separator) {
  auto base = ether_mail_domain();
  auto reference = courier::eip712::bind(base);

  auto changed = base;
  changed.name = "Ether Mail 2";
  EXPECT_NE(courier::eip712::bind(changed), reference);
  changed = base;
  changed.version = "2";
  EXPECT_NE(courier::eip712::bind(changed), reference);
  changed = base;
  changed.chain_id = 5;
  EXPECT_NE(courier::eip712::bind(changed), reference);
  changed = base;
  changed.verifying_contract = courier::testing::make_address(0x01);
  EXPECT_NE(courier::eip712::bind(changed), reference);
}
