// KeyPointDetector marks samples that carry behaviour the geometric
// simplifier cannot see: elevation events, turns and speed changes.

#include "core/KeyPointDetector.hpp"
#include "core/GeoUtils.hpp"
#include <cmath>

namespace tc {

std::vector<uint8_t>
KeyPointDetector::classify(const Track &samples, double elevation_threshold,
                           bool preserve_elevation_changes) {
  const std::size_t n = samples.size();
  std::vector<uint8_t> flags(n, kKeyNone);
  if (n == 0)
    return flags;

  // 1) endpoints always survive
  flags.front() |= kKeyEndpoint;
  flags.back() |= kKeyEndpoint;

  for (std::size_t i = 1; i < n; ++i) {
    const Sample &prev = samples[i - 1];
    const Sample &cur = samples[i];

    // 4) speed rule applies to every index >= 1, including the last one
    if (std::fabs(cur.speed - prev.speed) >= kSpeedChangeThreshold)
      flags[i] |= kKeySpeed;

    if (i + 1 >= n)
      break;
    const Sample &next = samples[i + 1];

    // 2) elevation rule
    if (preserve_elevation_changes) {
      const double e_prev = prev.best_altitude();
      const double e_cur = cur.best_altitude();
      const double e_next = next.best_altitude();
      const double d_in = std::fabs(e_cur - e_prev);
      const double d_out = std::fabs(e_next - e_cur);
      const bool jump =
          d_in >= elevation_threshold || d_out >= elevation_threshold;
      if (jump)
        flags[i] |= kKeyElevation;

      // peaks and valleys only count when the swing clears the threshold,
      // so the extremum never selects a sample the jump rule missed
      const bool is_max = e_cur > e_prev && e_cur > e_next;
      const bool is_min = e_cur < e_prev && e_cur < e_next;
      if ((is_max || is_min) && jump)
        flags[i] |= kKeyExtremum;
    }

    // 3) turn rule
    const double turn = GeoUtils::turn_angle_deg(prev, cur, next);
    if (std::fabs(turn) >= kTurnThresholdDeg)
      flags[i] |= kKeyTurn;
  }
  return flags;
}

std::vector<std::size_t>
KeyPointDetector::detect(const Track &samples, double elevation_threshold,
                         bool preserve_elevation_changes) {
  const auto flags =
      classify(samples, elevation_threshold, preserve_elevation_changes);
  std::vector<std::size_t> out;
  for (std::size_t i = 0; i < flags.size(); ++i)
    if (flags[i] != kKeyNone)
      out.push_back(i);
  return out;
}

} // namespace tc
