#pragma once
#include "models/CoreTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace tc {

// Reasons a sample is forced to survive compression (bit flags).
enum KeyReason : uint8_t {
  kKeyNone = 0,
  kKeyEndpoint = 1 << 0,
  kKeyElevation = 1 << 1, // best altitude jump at or above the threshold
  kKeyTurn = 1 << 2,
  kKeySpeed = 1 << 3,
  kKeyExtremum = 1 << 4 // peak or valley, set together with kKeyElevation
};

class KeyPointDetector {
public:
  static constexpr double kTurnThresholdDeg = 30.0;
  static constexpr double kSpeedChangeThreshold = 2.0; // m/s
  static constexpr double kDefaultElevationThreshold = 2.0; // m

  // Per-sample OR of KeyReason flags, same length as `samples`.
  static std::vector<uint8_t>
  classify(const Track &samples, double elevation_threshold,
           bool preserve_elevation_changes);

  // Sorted indices whose classification is not kKeyNone.
  static std::vector<std::size_t>
  detect(const Track &samples, double elevation_threshold,
         bool preserve_elevation_changes);
};

} // namespace tc
