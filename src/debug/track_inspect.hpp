#pragma once
#include "core/TrackValidator.hpp"
#include "models/CompressionModel.hpp"
#include "models/TrackJson.hpp"
#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>

namespace tc {

// Compact JSON overview of a track and the samples a compression kept.
inline nlohmann::json summarize(const Track &samples,
                                const CompressionResult &r,
                                std::size_t sample_n = 3) {
  using nlohmann::json;
  json out;

  double min_lat = 90, min_lon = 180, max_lat = -90, max_lon = -180;
  double min_alt = 0, max_alt = 0;
  std::size_t accurate = 0, accurate_elev = 0;
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const auto &s = samples[i];
    min_lat = std::min(min_lat, s.latitude);
    max_lat = std::max(max_lat, s.latitude);
    min_lon = std::min(min_lon, s.longitude);
    max_lon = std::max(max_lon, s.longitude);
    const double a = s.best_altitude();
    min_alt = i ? std::min(min_alt, a) : a;
    max_alt = i ? std::max(max_alt, a) : a;
    accurate += s.is_accurate() ? 1 : 0;
    accurate_elev += s.has_accurate_elevation() ? 1 : 0;
  }

  out["track"] = {{"points", samples.size()},
                  {"accurate_fixes", accurate},
                  {"accurate_elevation_fixes", accurate_elev},
                  {"distance_m", TrackValidator::total_distance(samples)},
                  {"elevation_gain_m", TrackValidator::elevation_gain(samples)}};
  if (!samples.empty()) {
    out["track"]["bbox"] = {{"min_lat", min_lat},
                            {"min_lon", min_lon},
                            {"max_lat", max_lat},
                            {"max_lon", max_lon}};
    out["track"]["altitude"] = {{"min", min_alt}, {"max", max_alt}};
  }

  // steepest grade between consecutive kept samples
  double steepest = 0.0;
  for (std::size_t k = 1; k < r.kept_indices.size(); ++k) {
    const auto &a = samples.at(r.kept_indices[k - 1]);
    const auto &b = samples.at(r.kept_indices[k]);
    const double g = a.grade_to(b);
    if (std::abs(g) > std::abs(steepest))
      steepest = g;
  }

  json kept = json::array();
  const auto N = std::min(sample_n, r.kept_indices.size());
  for (std::size_t k = 0; k < N; ++k) {
    const std::size_t idx = r.kept_indices[k];
    json kj = samples.at(idx);
    kj["index"] = idx;
    kept.push_back(kj);
  }

  out["compressed"] = {{"points", r.compressed_count},
                       {"ratio", r.compression_ratio},
                       {"key_points", r.preserved_key_points},
                       {"steepest_grade_pct", steepest},
                       {"samples", kept}};
  return out;
}

} // namespace tc
