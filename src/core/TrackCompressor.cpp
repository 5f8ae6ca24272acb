// TrackCompressor joins the two independent passes: behavioural key points
// and geometric Douglas-Peucker selection.

#include "core/TrackCompressor.hpp"
#include "core/KeyPointDetector.hpp"
#include "core/Simplifier.hpp"
#include <algorithm>
#include <chrono>
#include <iterator>
#include <numeric>
#include <utility>

namespace tc {

CompressionResult TrackCompressor::compress(const CompressionRequest &req) {
  const auto t0 = std::chrono::steady_clock::now();
  const Track &pts = req.samples;
  const std::size_t n = pts.size();

  CompressionResult res;
  res.original_count = n;

  if (n <= 2) {
    res.kept_indices.resize(n);
    std::iota(res.kept_indices.begin(), res.kept_indices.end(), 0);
    res.compressed_count = n;
    res.compression_ratio = 1.0;
  } else {
    // 1) key points, 2) Douglas-Peucker over the whole track
    const auto keys = KeyPointDetector::detect(
        pts, req.elevation_threshold, req.preserve_elevation_changes);
    const auto dp = Simplifier::simplify(pts, req.epsilon, 0, n - 1);

    // 3) both inputs are sorted, so a merge-union keeps the order unique
    res.kept_indices.reserve(keys.size() + dp.size());
    std::set_union(keys.begin(), keys.end(), dp.begin(), dp.end(),
                   std::back_inserter(res.kept_indices));

    res.preserved_key_points = keys.size();
    res.compressed_count = res.kept_indices.size();
    res.compression_ratio = static_cast<double>(res.compressed_count) /
                            static_cast<double>(n);
  }

  const auto t1 = std::chrono::steady_clock::now();
  res.elapsed_ms =
      std::chrono::duration<double, std::milli>(t1 - t0).count();
  return res;
}

Track TrackCompressor::compress_samples(const CompressionRequest &req) {
  const CompressionResult res = compress(req);
  Track out;
  out.reserve(res.kept_indices.size());
  for (std::size_t idx : res.kept_indices) {
    Sample s = req.samples[idx];
    s.is_key_point = true;
    s.compression_index = idx;
    out.push_back(std::move(s));
  }
  return out;
}

} // namespace tc
