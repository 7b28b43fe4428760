#include <gtest/gtest.h>
#include "adsb/msg/altitude.hpp"
#include "adsb/msg/cpr.hpp"
#include <cmath>

using namespace adsb::msg;

TEST(Cpr, NumberOfLongitudeZones) {
  EXPECT_EQ(cpr_nl(0.0), 59);
  EXPECT_EQ(cpr_nl(10.4704713), 58);
  EXPECT_EQ(cpr_nl(-10.4704713), 58);
  EXPECT_EQ(cpr_nl(52.25), 36);
  EXPECT_EQ(cpr_nl(59.95), 30);
  EXPECT_EQ(cpr_nl(87.0), 2);
  EXPECT_EQ(cpr_nl(-87.0), 2);
  EXPECT_EQ(cpr_nl(88.0), 1);
}

TEST(Cpr, GlobalDecodeEvenNewest) {
  CprFrame even{93000, 51372, 1.0};
  CprFrame odd{74158, 50194, 0.0};
  auto pos = cpr_decode_global(even, odd, CprFormat::Even);
  ASSERT_TRUE(pos.has_value());
  EXPECT_NEAR(pos->latitude, 52.2572021484375, 1e-9);
  EXPECT_NEAR(pos->longitude, 3.91937255859375, 1e-9);
}

TEST(Cpr, GlobalDecodeOddNewest) {
  CprFrame even{93000, 51372, 0.0};
  CprFrame odd{74158, 50194, 1.0};
  auto pos = cpr_decode_global(even, odd, CprFormat::Odd);
  ASSERT_TRUE(pos.has_value());
  EXPECT_NEAR(pos->latitude, 52.26578, 1e-5);
  EXPECT_NEAR(pos->longitude, 3.93891, 1e-5);
}

TEST(Cpr, ZoneMismatchRejected) {
  // Even and odd frames on opposite sides of the NL 59/58 boundary.
  auto [ylat_e, xlon_e] = cpr_encode(10.46, 3.9, CprFormat::Even);
  auto [ylat_o, xlon_o] = cpr_encode(10.48, 3.9, CprFormat::Odd);
  CprFrame even{ylat_e, xlon_e, 0.0};
  CprFrame odd{ylat_o, xlon_o, 1.0};
  EXPECT_FALSE(cpr_decode_global(even, odd, CprFormat::Odd).has_value());
  EXPECT_FALSE(cpr_decode_global(even, odd, CprFormat::Even).has_value());
}

TEST(Cpr, EncodeDecodeWithinOneLsb) {
  struct Point { double lat, lon; };
  const Point points[] = {{52.2572, 3.9194}, {-33.9, 151.2}, {40.6413, -73.7781}, {1.3644, 103.9915}};
  for (const auto& p : points) {
    auto [ye, xe] = cpr_encode(p.lat, p.lon, CprFormat::Even);
    auto [yo, xo] = cpr_encode(p.lat, p.lon, CprFormat::Odd);
    CprFrame even{ye, xe, 0.0};
    CprFrame odd{yo, xo, 0.5};
    for (auto newest : {CprFormat::Even, CprFormat::Odd}) {
      auto pos = cpr_decode_global(even, odd, newest);
      ASSERT_TRUE(pos.has_value()) << p.lat << "," << p.lon;
      // One LSB of a 6 degree zone is about 4.6e-5 degrees.
      EXPECT_NEAR(pos->latitude, p.lat, 1e-4) << p.lat << "," << p.lon;
      EXPECT_NEAR(pos->longitude, p.lon, 2e-4) << p.lat << "," << p.lon;
    }
  }
}

TEST(Altitude, QBitEncoding) {
  auto ft = decode_ac12(0xC38);
  ASSERT_TRUE(ft.has_value());
  EXPECT_DOUBLE_EQ(*ft, 38000.0);

  auto code = encode_ac12(38000.0);
  ASSERT_TRUE(code.has_value());
  EXPECT_EQ(*code, 0xC38u);
  EXPECT_DOUBLE_EQ(decode_ac12(*encode_ac12(-1000.0)).value(), -1000.0);
  EXPECT_DOUBLE_EQ(decode_ac12(*encode_ac12(50175.0)).value(), 50175.0);
  EXPECT_FALSE(encode_ac12(60000.0).has_value());
  EXPECT_FALSE(encode_ac12(-1100.0).has_value());
}

TEST(Altitude, NoAltitudeCode) {
  EXPECT_FALSE(decode_ac12(0).has_value());
}

TEST(Altitude, GillhamCoded) {
  // C1 only, Q=0: lowest Mode C step.
  auto ft = decode_ac12(0x800);
  ASSERT_TRUE(ft.has_value());
  EXPECT_DOUBLE_EQ(*ft, -800.0);

  // No C bit set is not a valid Gillham code.
  EXPECT_FALSE(gillham_to_hundreds(0x0800).has_value());
  ASSERT_TRUE(gillham_to_hundreds(0x1000).has_value());
  EXPECT_EQ(*gillham_to_hundreds(0x1000), -8);
}
