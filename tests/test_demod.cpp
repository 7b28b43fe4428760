#include <gtest/gtest.h>
#include "adsb/rx/demod.hpp"
#include "adsb/tx/frame_tx.hpp"
#include "adsb/constants.hpp"
#include <complex>
#include <vector>

using namespace adsb;

TEST(Demod, PulsePositionDecision) {
  const unsigned spc = 3;
  // Pulse in the first chip -> 1, in the second -> 0.
  std::vector<float> one = {1, 1, 1, 0, 0, 0};
  std::vector<float> zero = {0, 0, 0, 1, 1, 1};
  EXPECT_EQ(rx::demod_bit(one.data(), spc), 1u);
  EXPECT_EQ(rx::demod_bit(zero.data(), spc), 0u);
}

TEST(Demod, TieDecodesAsZero) {
  std::vector<float> flat(4, 0.25f);
  EXPECT_EQ(rx::demod_bit(flat.data(), 2), 0u);
  std::vector<float> silent(4, 0.0f);
  EXPECT_EQ(rx::demod_bit(silent.data(), 2), 0u);
}

TEST(Demod, ModulatedBitsRecovered) {
  const unsigned spc = 2;
  std::vector<uint8_t> bits = {1, 0, 0, 1, 1, 1, 0, 1, 0, 0, 1, 0};
  auto iq = tx::modulate(bits, spc, 0.7f);
  const size_t pre = MODES_SYNC_CHIPS * spc;
  ASSERT_EQ(iq.size(), pre + bits.size() * 2 * spc);

  std::vector<float> energy(iq.size());
  for (size_t n = 0; n < iq.size(); ++n) energy[n] = std::norm(iq[n]);
  // Unequal chip levels still decide on the larger chip.
  energy[pre + 1] *= 0.3f;

  std::vector<uint8_t> out(bits.size());
  rx::demod_bits(energy.data() + pre, bits.size(), spc, out.data());
  EXPECT_EQ(out, bits);
}

TEST(Demod, PreambleLayout) {
  auto iq = tx::modulate({}, 1, 1.0f);
  ASSERT_EQ(iq.size(), MODES_SYNC_CHIPS);
  for (size_t k = 0; k < MODES_SYNC_CHIPS; ++k)
    EXPECT_FLOAT_EQ(iq[k].real(), MODES_SYNC_SEQUENCE[k] ? 1.0f : 0.0f) << "chip " << k;
}
