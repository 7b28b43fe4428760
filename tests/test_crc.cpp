#include <gtest/gtest.h>
#include "adsb/utils/bits.hpp"
#include "adsb/utils/crc.hpp"
#include "adsb/tx/frame_tx.hpp"
#include <cstdint>
#include <vector>

using namespace adsb::utils;

namespace {

std::vector<uint8_t> bits_of(const char* hex) {
  auto b = hex_to_bits(hex);
  EXPECT_TRUE(b.has_value()) << hex;
  return b.value_or(std::vector<uint8_t>{});
}

} // namespace

TEST(ModeSCrc, ExtendedSquittersVerify) {
  const char* msgs[] = {
      "8D4840D6202CC371C32CE0576098",
      "8D40621D58C382D690C8AC2863A7",
      "8D40621D58C386435CC412692AD6",
      "8D485020994409940838175B284F",
      "8DA05F219B06B6AF189400CBC33F",
  };
  ModeSCrc crc;
  for (const char* hex : msgs) {
    auto bits = bits_of(hex);
    ASSERT_EQ(bits.size(), 112u);
    auto [ok, parity] = crc.verify_with_parity(bits.data(), bits.size());
    EXPECT_TRUE(ok) << hex;
    EXPECT_EQ(parity, bits_to_uint(bits.data() + 88, 24)) << hex;
    EXPECT_EQ(crc.remainder(bits.data(), bits.size()), 0u) << hex;
  }
}

TEST(ModeSCrc, SingleBitErrorsDetected) {
  ModeSCrc crc;
  auto ref = bits_of("8D4840D6202CC371C32CE0576098");
  for (size_t i = 0; i < ref.size(); ++i) {
    auto bits = ref;
    bits[i] ^= 1u;
    EXPECT_FALSE(crc.verify_with_parity(bits.data(), bits.size()).first) << "bit " << i;
    EXPECT_NE(crc.remainder(bits.data(), bits.size()), 0u) << "bit " << i;
  }
}

TEST(ModeSCrc, WriteParityShortReply) {
  ModeSCrc crc;
  auto bits = adsb::tx::make_all_call_reply(5, 0x4840D6);
  ASSERT_EQ(bits.size(), 56u);
  EXPECT_EQ(bits_to_uint(bits.data(), 5), 11u);
  EXPECT_EQ(bits_to_uint(bits.data() + 8, 24), 0x4840D6u);
  EXPECT_TRUE(crc.verify_with_parity(bits.data(), bits.size()).first);

  // Rewriting parity after a data change restores a valid message.
  bits[20] ^= 1u;
  EXPECT_FALSE(crc.verify_with_parity(bits.data(), bits.size()).first);
  crc.write_parity(bits.data(), bits.size());
  EXPECT_TRUE(crc.verify_with_parity(bits.data(), bits.size()).first);
}

TEST(ModeSCrc, RemainderIsParityXorOverlay) {
  ModeSCrc crc;
  std::vector<uint8_t> bits(56, 0);
  uint_to_bits(4, 5, bits.data());            // DF4
  uint_to_bits(0x1234, 16, bits.data() + 8);  // arbitrary surveillance fields
  const uint32_t address = 0xABCDEF;
  uint_to_bits(crc.compute(bits.data(), 32) ^ address, 24, bits.data() + 32);
  EXPECT_EQ(crc.remainder(bits.data(), bits.size()), address);
}

TEST(ModeSCrc, TooShort) {
  ModeSCrc crc;
  std::vector<uint8_t> bits(24, 0);
  EXPECT_FALSE(crc.verify_with_parity(bits.data(), bits.size()).first);
  EXPECT_EQ(crc.remainder(bits.data(), 10), 0xFFFFFFu);
}

TEST(Bits, HexRoundTrip) {
  auto bits = bits_of("8d4840d6");
  ASSERT_EQ(bits.size(), 32u);
  EXPECT_EQ(bits_to_uint(bits.data(), 8), 0x8Du);
  EXPECT_EQ(bits_to_hex(bits.data(), bits.size()), "8D4840D6");
  EXPECT_FALSE(hex_to_bits("8D4G").has_value());
  ASSERT_TRUE(hex_to_bits("").has_value());
  EXPECT_TRUE(hex_to_bits("")->empty());
}
