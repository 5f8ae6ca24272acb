#include "core/TrackValidator.hpp"
#include "core/GeoUtils.hpp"
#include <cmath>

namespace tc {

double TrackValidator::elevation_gain(const Track &seq) {
  double gain = 0.0;
  for (std::size_t i = 1; i < seq.size(); ++i) {
    const double dh = seq[i - 1].elevation_change_to(seq[i]);
    if (dh > 0)
      gain += dh;
  }
  return gain;
}

double TrackValidator::total_distance(const Track &seq) {
  double dist = 0.0;
  for (std::size_t i = 1; i < seq.size(); ++i)
    dist += GeoUtils::haversine(seq[i - 1], seq[i]);
  return dist;
}

// percentage is defined as 0 when the reference metric is 0
static inline double pct_of(double err, double reference) {
  return reference > 0 ? (err / reference) * 100.0 : 0.0;
}

ValidationResult TrackValidator::validate(const Track &original,
                                          const Track &compressed) {
  const double gain_o = elevation_gain(original);
  const double gain_c = elevation_gain(compressed);
  const double dist_o = total_distance(original);
  const double dist_c = total_distance(compressed);

  ValidationResult v;
  v.elevation_gain_error = std::fabs(gain_o - gain_c);
  v.elevation_gain_error_pct = pct_of(v.elevation_gain_error, gain_o);
  v.distance_error = std::fabs(dist_o - dist_c);
  v.distance_error_pct = pct_of(v.distance_error, dist_o);
  v.is_valid = v.elevation_gain_error_pct < kMaxElevationErrorPct &&
               v.distance_error_pct < kMaxDistanceErrorPct;
  return v;
}

ValidationResult
TrackValidator::validate(const Track &original,
                         const std::vector<std::size_t> &kept_indices) {
  return validate(original, select(original, kept_indices));
}

Track TrackValidator::select(const Track &original,
                             const std::vector<std::size_t> &kept_indices) {
  Track out;
  out.reserve(kept_indices.size());
  for (std::size_t idx : kept_indices)
    if (idx < original.size())
      out.push_back(original[idx]);
  return out;
}

} // namespace tc
