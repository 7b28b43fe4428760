#include <gtest/gtest.h>
#include "adsb/config.hpp"
#include "adsb/constants.hpp"
#include "adsb/msg/altitude.hpp"
#include "adsb/msg/cpr.hpp"
#include "adsb/receiver.hpp"
#include "adsb/tx/frame_tx.hpp"
#include <algorithm>
#include <cmath>
#include <complex>
#include <vector>

using namespace adsb;

namespace {

std::vector<uint8_t> position_squitter(uint32_t icao, double alt_ft, msg::CprFormat fmt,
                                       double lat, double lon) {
  tx::AirbornePosition pos;
  pos.altitude_code = msg::encode_ac12(alt_ft).value();
  pos.format = fmt;
  auto [ylat, xlon] = msg::cpr_encode(lat, lon, fmt);
  pos.lat_cpr = ylat;
  pos.lon_cpr = xlon;
  return tx::make_extended_squitter(DF_EXTENDED_SQUITTER, 5, icao, tx::encode_me(pos));
}

void place(std::vector<std::complex<float>>& frame, size_t at, const std::vector<std::complex<float>>& burst) {
  ASSERT_LE(at + burst.size(), frame.size());
  std::copy(burst.begin(), burst.end(), frame.begin() + static_cast<std::ptrdiff_t>(at));
}

ReceiverConfig pluto_test_config() {
  ReceiverParams p = pluto_params();
  p.samples_per_frame = 6000;
  p.max_packets_per_frame = 4;
  return make_receiver_config(p);
}

} // namespace

TEST(Receiver, DecodesPositionSquitter) {
  ReceiverConfig cfg = pluto_test_config();
  Receiver rx(cfg);
  std::vector<std::complex<float>> frame(cfg.samples_per_frame, {0.0f, 0.0f});
  auto bits = position_squitter(0x4840D6, 38000.0, msg::CprFormat::Even, 52.2572, 3.9194);
  place(frame, 1000, tx::modulate(bits, cfg.samples_per_chip, 0.3f));

  FrameResult r = rx.process(frame, 5.0);
  ASSERT_EQ(r.phy.packet_count, 1u);
  ASSERT_EQ(r.message_count, 1u);
  const auto& m = r.messages[0];
  EXPECT_EQ(m.icao24, "4840D6");
  EXPECT_FALSE(m.crc_error);
  EXPECT_EQ(m.df, 17u);
  EXPECT_EQ(m.tc, 11);
  EXPECT_DOUBLE_EQ(m.altitude, 38000.0);
  EXPECT_NEAR(m.time, 5.0 + 1000.0 / cfg.sample_rate, 1e-12);
  ASSERT_TRUE(r.phy.last_packet.has_value());
  EXPECT_EQ(r.phy.last_packet->size(), cfg.max_packet_length);

  EXPECT_EQ(rx.stats().frames, 1u);
  EXPECT_EQ(rx.stats().crc_ok, 1u);
  EXPECT_EQ(rx.stats().per_df[17], 1u);
  EXPECT_EQ(rx.stats().per_tc[11], 1u);
  EXPECT_EQ(rx.parser_state().tracked(), 1u);
}

TEST(Receiver, CorruptedPacketNotDecoded) {
  ReceiverConfig cfg = pluto_test_config();
  Receiver rx(cfg);
  std::vector<std::complex<float>> frame(cfg.samples_per_frame, {0.0f, 0.0f});
  auto bits = position_squitter(0x4840D6, 38000.0, msg::CprFormat::Even, 52.2572, 3.9194);
  bits[50] ^= 1u;
  place(frame, 2000, tx::modulate(bits, cfg.samples_per_chip, 1.0f));

  FrameResult r = rx.process(frame, 0.0);
  EXPECT_EQ(r.phy.packet_count, 1u);
  EXPECT_TRUE(r.phy.packets[0].crc_error);
  EXPECT_EQ(r.message_count, 0u);
  EXPECT_FALSE(r.phy.last_packet.has_value());
  EXPECT_EQ(rx.stats().crc_failed, 1u);
  EXPECT_DOUBLE_EQ(rx.stats().packet_error_rate(), 1.0);
}

TEST(Receiver, PositionAcrossFrames) {
  ReceiverConfig cfg = pluto_test_config();
  Receiver rx(cfg);
  const double lat = -33.9, lon = 151.2;

  std::vector<std::complex<float>> f1(cfg.samples_per_frame, {0.0f, 0.0f});
  place(f1, 500, tx::modulate(position_squitter(0x7C6DB8, 35000.0, msg::CprFormat::Even, lat, lon),
                              cfg.samples_per_chip, 1.0f));
  // Odd frame straddles the boundary into the next frame.
  std::vector<std::complex<float>> stream(2 * cfg.samples_per_frame, {0.0f, 0.0f});
  place(stream, cfg.samples_per_frame - 400,
        tx::modulate(position_squitter(0x7C6DB8, 35000.0, msg::CprFormat::Odd, lat, lon),
                     cfg.samples_per_chip, 1.0f));

  auto r1 = rx.process_next(f1);
  ASSERT_EQ(r1.message_count, 1u);
  EXPECT_TRUE(std::isnan(r1.messages[0].latitude));

  auto r2 = rx.process_next(std::span<const std::complex<float>>(stream.data(), cfg.samples_per_frame));
  EXPECT_EQ(r2.message_count, 0u);
  auto r3 = rx.process_next(std::span<const std::complex<float>>(stream.data() + cfg.samples_per_frame,
                                                                 cfg.samples_per_frame));
  ASSERT_EQ(r3.message_count, 1u);
  const auto& m = r3.messages[0];
  EXPECT_EQ(m.cpr_format, msg::CprFormat::Odd);
  EXPECT_DOUBLE_EQ(m.altitude, 35000.0);
  EXPECT_NEAR(m.latitude, lat, 1e-4);
  EXPECT_NEAR(m.longitude, lon, 2e-4);
  // Stamped in the frame where it started.
  EXPECT_NEAR(m.time, 2 * cfg.frame_duration - 400.0 / cfg.sample_rate, 1e-9);
  EXPECT_NEAR(rx.radio_time(), 3 * cfg.frame_duration, 1e-12);
}

TEST(Receiver, InterpolatedFrontEnd) {
  ReceiverParams p;
  p.front_end_sample_rate = 2e6;
  p.samples_per_frame = 4000;
  ReceiverConfig cfg = make_receiver_config(p);
  ASSERT_EQ(cfg.interpolation_factor, 2u);
  Receiver rx(cfg);

  // One sample per chip at the front end.
  std::vector<std::complex<float>> frame(cfg.samples_per_frame, {0.0f, 0.0f});
  const size_t at = 1000;
  auto es = position_squitter(0x4840D6, 38000.0, msg::CprFormat::Even, 52.2572, 3.9194);
  place(frame, at, tx::modulate(es, 1, 1.0f));
  auto reply = tx::make_all_call_reply(5, 0x4840D6);
  place(frame, 2000, tx::modulate(reply, 1, 1.0f));

  FrameResult r = rx.process(frame, 0.0);
  ASSERT_EQ(r.message_count, 2u);
  EXPECT_EQ(r.messages[0].df, 17u);
  EXPECT_EQ(r.messages[0].icao24, "4840D6");
  EXPECT_DOUBLE_EQ(r.messages[0].altitude, 38000.0);
  // Interpolator delay is removed from the timestamp.
  EXPECT_NEAR(r.messages[0].time, at / cfg.front_end_sample_rate, 2.0 / cfg.sample_rate);
  EXPECT_EQ(r.messages[1].df, 11u);
  EXPECT_EQ(r.messages[1].icao24, "4840D6");
  EXPECT_EQ(rx.stats().crc_failed, 0u);
}

TEST(Receiver, ResetClearsState) {
  ReceiverConfig cfg = pluto_test_config();
  Receiver rx(cfg);
  std::vector<std::complex<float>> frame(cfg.samples_per_frame, {0.0f, 0.0f});
  place(frame, 100, tx::modulate(position_squitter(0x4840D6, 38000.0, msg::CprFormat::Even, 52.2572, 3.9194),
                                 cfg.samples_per_chip, 1.0f));
  rx.process_next(frame);
  EXPECT_GT(rx.radio_time(), 0.0);
  EXPECT_EQ(rx.parser_state().tracked(), 1u);

  rx.reset();
  EXPECT_DOUBLE_EQ(rx.radio_time(), 0.0);
  EXPECT_EQ(rx.parser_state().tracked(), 0u);
  EXPECT_EQ(rx.stats().frames, 0u);
  EXPECT_EQ(rx.config().samples_per_frame, cfg.samples_per_frame);
}
