#pragma once
#include "models/CompressionModel.hpp"
#include "models/CoreTypes.hpp"
#include <cstddef>
#include <vector>

namespace tc {

// Acceptance gate comparing whole-track aggregates before and after
// compression. Advisory: the caller decides what to do with an invalid result.
class TrackValidator {
public:
  static constexpr double kMaxElevationErrorPct = 5.0;
  static constexpr double kMaxDistanceErrorPct = 2.0;

  // Sum of positive consecutive best-altitude deltas (metres)
  static double elevation_gain(const Track &seq);
  // Sum of consecutive haversine distances (metres)
  static double total_distance(const Track &seq);

  static ValidationResult validate(const Track &original,
                                   const Track &compressed);

  // Convenience for index results: compares `original` with the subsequence
  // selected by `kept_indices`.
  static ValidationResult validate(const Track &original,
                                   const std::vector<std::size_t> &kept_indices);

  static Track select(const Track &original,
                      const std::vector<std::size_t> &kept_indices);
};

} // namespace tc
