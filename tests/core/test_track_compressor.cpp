#include "core/TrackCompressor.hpp"
#include "track_fixtures.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <random>
#include <type_traits>
#include <utility>

using namespace tc;
using namespace tc::test;

static CompressionResult run(const Track &t, double eps,
                             bool preserve = true, double threshold = 2.0) {
  return TrackCompressor::compress(
      CompressionRequest{t, eps, preserve, threshold});
}

static bool contains(const std::vector<std::size_t> &v, std::size_t i) {
  return std::find(v.begin(), v.end(), i) != v.end();
}

// Shared shape checks on any result.
static void expect_well_formed(const CompressionResult &r, std::size_t n) {
  EXPECT_EQ(r.original_count, n);
  EXPECT_EQ(r.compressed_count, r.kept_indices.size());
  EXPECT_TRUE(std::is_sorted(r.kept_indices.begin(), r.kept_indices.end()));
  EXPECT_EQ(std::adjacent_find(r.kept_indices.begin(), r.kept_indices.end()),
            r.kept_indices.end());
  if (n > 0) {
    ASSERT_FALSE(r.kept_indices.empty());
    EXPECT_EQ(r.kept_indices.front(), 0u);
    EXPECT_EQ(r.kept_indices.back(), n - 1);
    EXPECT_DOUBLE_EQ(r.compression_ratio,
                     static_cast<double>(r.compressed_count) / n);
  }
  EXPECT_GE(r.elapsed_ms, 0.0);
}

TEST(TrackCompressor, TinyTracksAreReturnedWhole) {
  for (std::size_t n : {0u, 1u, 2u}) {
    const Track t = straight_line(n);
    const auto r = run(t, 5.0);
    EXPECT_EQ(r.kept_indices.size(), n);
    EXPECT_EQ(r.compressed_count, n);
    EXPECT_DOUBLE_EQ(r.compression_ratio, 1.0);
    EXPECT_EQ(r.preserved_key_points, 0u);
  }
}

TEST(TrackCompressor, StraightLineKeepsEndpoints) {
  const Track t = straight_line(100);
  const auto r = run(t, 5.0);
  expect_well_formed(r, 100);
  EXPECT_EQ(r.kept_indices, (std::vector<std::size_t>{0, 99}));
  EXPECT_NEAR(r.compression_ratio, 0.02, 1e-12);
  EXPECT_EQ(r.preserved_key_points, 2u);
}

TEST(TrackCompressor, LateralOffsetIsKept) {
  // the offset sample also bends the path at both of its neighbours, so those
  // survive on the turn rule and on their own chord distance
  Track t = straight_line(100);
  t[50] = at_offset(50.0, 10.0);
  const auto r = run(t, 5.0);
  expect_well_formed(r, 100);
  EXPECT_TRUE(contains(r.kept_indices, 50));
  EXPECT_EQ(r.kept_indices, (std::vector<std::size_t>{0, 49, 50, 51, 99}));
}

TEST(TrackCompressor, ElevationSpikeSurvivesLooseTolerance) {
  Track t = straight_line(100);
  t[50].raw_altitude += 10.0;
  const auto r = run(t, 1000.0);
  expect_well_formed(r, 100);
  EXPECT_TRUE(contains(r.kept_indices, 50));
}

TEST(TrackCompressor, RightAngleTurnSurvivesLooseTolerance) {
  const Track t = {at_offset(0, 0), at_offset(100, 0), at_offset(100, 100)};
  const auto r = run(t, 1000.0);
  EXPECT_EQ(r.kept_indices, (std::vector<std::size_t>{0, 1, 2}));
}

TEST(TrackCompressor, ZigzagKeepsEveryVertex) {
  Track t;
  for (int i = 0; i < 12; ++i)
    t.push_back(at_offset(i * 20.0, (i % 2) ? 15.0 : 0.0));
  const auto r = run(t, 1.0);
  EXPECT_EQ(r.compressed_count, t.size());
}

TEST(TrackCompressor, ElevationProfileIsPreserved) {
  Track t = straight_line(6, 10.0);
  const double profile[] = {10, 15, 25, 30, 20, 10};
  for (std::size_t i = 0; i < t.size(); ++i)
    t[i].raw_altitude = profile[i];

  const auto kept = run(t, 5.0, true, 3.0);
  EXPECT_EQ(kept.compressed_count, 6u);

  const auto dropped = run(t, 5.0, false, 3.0);
  EXPECT_EQ(dropped.kept_indices, (std::vector<std::size_t>{0, 5}));
}

TEST(TrackCompressor, LargerToleranceNeverKeepsMore) {
  const Track t = sine_track(500, 5.0, 30.0, 120.0);
  std::size_t prev = t.size() + 1;
  for (double eps : {0.5, 1.0, 2.0, 5.0, 10.0, 20.0, 100.0}) {
    const auto r = run(t, eps, false);
    expect_well_formed(r, t.size());
    EXPECT_LE(r.compressed_count, prev) << "eps " << eps;
    prev = r.compressed_count;
  }
}

TEST(TrackCompressor, RecompressionKeepsASubset) {
  Track t = sine_track(800, 3.0, 15.0, 90.0);
  std::mt19937 rng(11);
  std::uniform_real_distribution<double> jitter(-1.0, 1.0);
  for (auto &s : t)
    s.raw_altitude += jitter(rng);

  const auto params = CompressionRequest{t, 4.0, true, 2.0};
  const Track once = TrackCompressor::compress_samples(params);
  const auto first = TrackCompressor::compress(params).kept_indices;

  for (double eps : {4.0, 8.0}) {
    const auto again = run(once, eps);
    expect_well_formed(again, once.size());
    for (std::size_t k : again.kept_indices) {
      ASSERT_TRUE(once[k].compression_index.has_value());
      EXPECT_TRUE(contains(first, *once[k].compression_index));
    }
  }
}

TEST(TrackCompressor, CompressSamplesTagsCopies) {
  Track t = straight_line(100);
  t[50].raw_altitude += 10.0;
  const Track before = t;

  const auto req = CompressionRequest{t, 5.0, true, 2.0};
  const Track out = TrackCompressor::compress_samples(req);
  const auto r = TrackCompressor::compress(req);

  ASSERT_EQ(out.size(), r.kept_indices.size());
  for (std::size_t k = 0; k < out.size(); ++k) {
    EXPECT_TRUE(out[k].is_key_point);
    ASSERT_TRUE(out[k].compression_index.has_value());
    EXPECT_EQ(*out[k].compression_index, r.kept_indices[k]);
    EXPECT_DOUBLE_EQ(out[k].latitude, t[r.kept_indices[k]].latitude);
    EXPECT_DOUBLE_EQ(out[k].raw_altitude, t[r.kept_indices[k]].raw_altitude);
  }

  // input left as recorded
  for (std::size_t i = 0; i < t.size(); ++i) {
    EXPECT_FALSE(t[i].is_key_point);
    EXPECT_FALSE(t[i].compression_index.has_value());
    EXPECT_DOUBLE_EQ(t[i].latitude, before[i].latitude);
  }
}

TEST(TrackCompressor, LargeTrackShrinks) {
  const Track t = sine_track(10000, 2.0, 40.0, 500.0);
  const auto r = run(t, 5.0);
  expect_well_formed(r, t.size());
  EXPECT_LT(r.compressed_count, t.size());
  EXPECT_LE(r.preserved_key_points, r.compressed_count);
}

template <typename T, typename = void>
struct CanMakeRequest : std::false_type {};
template <typename T>
struct CanMakeRequest<T, std::void_t<decltype(TrackCompressor::make_request(
                             std::declval<T>(),
                             std::declval<const CompressionParams &>()))>>
    : std::true_type {};

TEST(TrackCompressor, MakeRequestOnlyBorrowsLiveTracks) {
  static_assert(CanMakeRequest<Track &>::value, "lvalue track");
  static_assert(CanMakeRequest<const Track &>::value, "const lvalue track");
  static_assert(!CanMakeRequest<Track>::value, "temporary track");

  const Track t = straight_line(100);
  CompressionParams p;
  p.epsilon = 5.0;
  const auto r = TrackCompressor::compress(TrackCompressor::make_request(t, p));
  EXPECT_EQ(r.kept_indices, (std::vector<std::size_t>{0, 99}));
}
