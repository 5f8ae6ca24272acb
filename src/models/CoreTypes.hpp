#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace tc {

// Basic spatial coordinate with elevation.
struct Coordinate {
  double lat;
  double lon;
  double elv;
};

// A single timestamped fix as recorded during an activity. Compression only
// ever selects samples; it never edits the position or sensor fields.
struct Sample {
  double timestamp = 0.0; // seconds, non-decreasing within a track
  double latitude = 0.0;  // degrees
  double longitude = 0.0; // degrees

  // Altitude estimates (metres)
  double raw_altitude = 0.0; // device reported, always present
  std::optional<double> barometric_altitude;
  std::optional<double> fused_altitude;
  std::optional<double> elevation_confidence; // 0..1, goes with fused
  std::optional<double> elevation_accuracy;   // metres

  double horizontal_accuracy = 0.0;
  double vertical_accuracy = 0.0;
  double speed = 0.0;   // m/s, >= 0
  double course = -1.0; // degrees, negative = unknown

  // Set on the copies returned by TrackCompressor::compress_samples
  bool is_key_point = false;
  std::optional<std::size_t> compression_index;

  /* Resolved elevation used by every downstream computation:
   * 1. fused altitude when present and confidence >= 0.5
   * 2. barometric altitude when present
   * 3. raw GPS altitude
   */
  double best_altitude() const {
    if (fused_altitude && elevation_confidence && *elevation_confidence >= 0.5)
      return *fused_altitude;
    if (barometric_altitude)
      return *barometric_altitude;
    return raw_altitude;
  }

  double elevation_change_to(const Sample &other) const {
    return other.best_altitude() - best_altitude();
  }

  // Grade in percent to another sample, clamped to +-20%.
  double grade_to(const Sample &other) const;

  bool is_accurate() const {
    return horizontal_accuracy <= 10.0 && horizontal_accuracy > 0.0;
  }

  // True when elevation meets the +-1 m target with a confident fusion.
  bool has_accurate_elevation() const {
    if (!elevation_accuracy || !elevation_confidence)
      return false;
    return *elevation_accuracy <= 1.0 && *elevation_confidence >= 0.7;
  }

  Coordinate coord() const { return {latitude, longitude, best_altitude()}; }
};

using Track = std::vector<Sample>;

} // namespace tc
