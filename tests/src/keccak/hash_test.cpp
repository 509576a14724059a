#include <gtest/gtest.h>
#include <courier/keccak/hash.hpp>

#include <string>

using namespace courier::schema;

TEST(keccak_hash, empty_input) {
  EXPECT_EQ(to_hex(courier::keccak::hash(std::string_view{})),
            "0xc5d2460186f7233c927e7db2dcc703c0"
            "e500b653ca82273b7bfad8045d85a470");
}

TEST(keccak_hash, abc) {
  EXPECT_EQ(to_hex(courier::keccak::hash(std::string_view{"abc"})),
            "0x4e03657aea45a94fc7d47ba826c8d667"
            "c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(keccak_hash, string_and_bytes_agree) {
  auto text = std::string_view{"courier"};
  EXPECT_EQ(courier::keccak::hash(text),
            courier::keccak::hash(make_bytes_view(text)));
}

TEST(keccak_hash, incremental_updates_match_single_shot) {
  // Longer than one 136-byte block so absorption crosses a permutation.
  auto input = std::string(300, 'a');
  for (std::size_t i = 0; i < input.size(); ++i) {
    input[i] = static_cast<char>('a' + (i % 26));
  }
  auto hasher = courier::keccak::hasher{};
  hasher.update(std::string_view{input}.substr(0, 1))
      .update(std::string_view{input}.substr(1, 135))
      .update(std::string_view{input}.substr(136, 100))
      .update(std::string_view{input}.substr(236));
  EXPECT_EQ(hasher.finalize(),
            courier::keccak::hash(std::string_view{input}));
}

TEST(keccak_hash, exact_rate_boundary) {
  auto block = std::string(136, 'x');
  auto other = std::string(135, 'x');
  EXPECT_NE(courier::keccak::hash(std::string_view{block}),
            courier::keccak::hash(std::string_view{other}));
}

TEST(keccak_hash, hasher_resets_after_finalize) {
  auto hasher = courier::keccak::hasher{};
  hasher.update(std::string_view{"first"});
  static_cast<void>(hasher.finalize());
  hasher.update(std::string_view{"abc"});
  EXPECT_EQ(hasher.finalize(),
            courier::keccak::hash(std::string_view{"abc"}));
}
