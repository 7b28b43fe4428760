#include <gtest/gtest.h>
#include "adsb/config.hpp"
#include "adsb/rx/interpolator.hpp"
#include "adsb/workspace.hpp"
#include <cmath>
#include <complex>
#include <vector>

using namespace adsb;

TEST(Interpolator, IdentityAtUnitFactor) {
  Workspace ws(make_receiver_config(pluto_params()));
  std::vector<std::complex<float>> x = {{1.0f, 0.5f}, {0.0f, -1.0f}, {2.0f, 0.0f}};
  auto y = rx::interpolate(ws, x);
  ASSERT_EQ(y.size(), x.size());
  EXPECT_EQ(y.data(), x.data());
}

TEST(Interpolator, EmptyInput) {
  Workspace ws(make_receiver_config(rtlsdr_params()));
  auto y = rx::interpolate(ws, std::span<const std::complex<float>>());
  EXPECT_TRUE(y.empty());
}

TEST(Interpolator, OutputLengthScales) {
  ReceiverConfig cfg = make_receiver_config(rtlsdr_params());
  Workspace ws(cfg);
  std::vector<std::complex<float>> x(1000, {0.0f, 0.0f});
  auto y = rx::interpolate(ws, x);
  EXPECT_EQ(y.size(), x.size() * cfg.interpolation_factor);
}

TEST(Interpolator, ConstantInputSettlesToUnitGain) {
  ReceiverParams p;
  p.front_end_sample_rate = 2e6;
  ReceiverConfig cfg = make_receiver_config(p);
  ASSERT_EQ(cfg.interpolation_factor, 2u);
  Workspace ws(cfg);

  std::vector<std::complex<float>> x(200, {1.0f, 0.0f});
  auto y = rx::interpolate(ws, x);
  ASSERT_EQ(y.size(), 400u);
  // Past the filter transient every output sample sits near the input level.
  for (size_t n = 2 * cfg.interpolation_filter.size(); n < y.size(); ++n) {
    EXPECT_NEAR(y[n].real(), 1.0f, 0.05f) << "n=" << n;
    EXPECT_NEAR(y[n].imag(), 0.0f, 1e-5f) << "n=" << n;
  }
}

TEST(Interpolator, HistoryCarriesAcrossCalls) {
  ReceiverParams p;
  p.front_end_sample_rate = 2e6;
  ReceiverConfig cfg = make_receiver_config(p);

  std::vector<std::complex<float>> x(64);
  for (size_t n = 0; n < x.size(); ++n)
    x[n] = {std::cos(0.3f * n), std::sin(0.3f * n)};

  Workspace whole(cfg);
  auto y_whole = rx::interpolate(whole, x);
  std::vector<std::complex<float>> ref(y_whole.begin(), y_whole.end());

  Workspace split(cfg);
  std::vector<std::complex<float>> got;
  auto a = rx::interpolate(split, std::span<const std::complex<float>>(x.data(), 40));
  got.assign(a.begin(), a.end());
  auto b = rx::interpolate(split, std::span<const std::complex<float>>(x.data() + 40, 24));
  got.insert(got.end(), b.begin(), b.end());

  ASSERT_EQ(got.size(), ref.size());
  for (size_t n = 0; n < ref.size(); ++n) {
    EXPECT_NEAR(got[n].real(), ref[n].real(), 1e-5f) << "n=" << n;
    EXPECT_NEAR(got[n].imag(), ref[n].imag(), 1e-5f) << "n=" << n;
  }
}
