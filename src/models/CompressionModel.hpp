#pragma once

#include "models/CoreTypes.hpp"
#include <cstddef>
#include <vector>

namespace tc {

// One compression invocation. The samples are borrowed; the caller keeps
// ownership and must keep them alive for the duration of the call.
struct CompressionRequest {
  const Track &samples;
  double epsilon = 5.0;
  bool preserve_elevation_changes = true;
  double elevation_threshold = 2.0;
};

// Outcome of TrackCompressor::compress.
struct CompressionResult {
  std::vector<std::size_t> kept_indices; // strictly increasing
  std::size_t original_count = 0;
  std::size_t compressed_count = 0;
  double compression_ratio = 1.0;      // compressed / original
  std::size_t preserved_key_points = 0; // size of the key point set
  double elapsed_ms = 0.0;
};

// Whole-track comparison between an original and a compressed track.
struct ValidationResult {
  double elevation_gain_error = 0.0;
  double elevation_gain_error_pct = 0.0;
  double distance_error = 0.0;
  double distance_error_pct = 0.0;
  bool is_valid = true;
};

} // namespace tc
