#include "core/TrackCompressor.hpp"
#include "debug/track_inspect.hpp"
#include "track_fixtures.hpp"
#include <gtest/gtest.h>

using namespace tc;
using namespace tc::test;

TEST(TrackInspect, SummarisesTrackAndKeptSamples) {
  Track t = straight_line(100);
  t[50].raw_altitude = 30.0;
  const auto r = TrackCompressor::compress(CompressionRequest{t, 5.0, true, 2.0});

  const auto j = summarize(t, r, 2);
  EXPECT_EQ(j.at("track").at("points"), 100);
  EXPECT_EQ(j.at("track").at("accurate_fixes"), 100);
  EXPECT_NEAR(j.at("track").at("distance_m").get<double>(), 99.0, 1e-6);
  EXPECT_DOUBLE_EQ(j.at("track").at("elevation_gain_m").get<double>(), 20.0);
  EXPECT_DOUBLE_EQ(j.at("track").at("altitude").at("max").get<double>(), 30.0);
  EXPECT_DOUBLE_EQ(j.at("track").at("altitude").at("min").get<double>(), 10.0);

  const auto &c = j.at("compressed");
  EXPECT_EQ(c.at("points"), r.compressed_count);
  EXPECT_EQ(c.at("key_points"), r.preserved_key_points);
  ASSERT_EQ(c.at("samples").size(), 2u);
  EXPECT_EQ(c.at("samples")[1].at("index"), r.kept_indices[1]);
  // 20 m over 1 m is far past the clamp
  EXPECT_DOUBLE_EQ(std::abs(c.at("steepest_grade_pct").get<double>()), 20.0);
}

TEST(TrackInspect, EmptyTrackHasNoBoundingBox) {
  const Track t;
  const auto r = TrackCompressor::compress(CompressionRequest{t, 5.0, true, 2.0});
  const auto j = summarize(t, r);
  EXPECT_EQ(j.at("track").at("points"), 0);
  EXPECT_FALSE(j.at("track").contains("bbox"));
  EXPECT_TRUE(j.at("compressed").at("samples").empty());
}
