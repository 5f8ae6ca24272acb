#pragma once
#include "models/CoreTypes.hpp"

namespace tc {

class GeoUtils {
public:
  static constexpr double kEarthRadiusM = 6371000.0;

  // haversine formulas, metres
  static double haversine(double lat1, double lon1, double lat2, double lon2);
  static double haversine(const Coordinate &p1, const Coordinate &p2);
  static double haversine(const Sample &p1, const Sample &p2);

  // Distance from `point` to the chord line_start -> line_end.
  // The foot of the perpendicular is found in raw lat/lon degree space
  // (t clamped to [0,1]); the distance to it is then measured with haversine.
  // A zero-length chord degrades to the point-to-point distance.
  static double perpendicular_distance(const Sample &point,
                                       const Sample &line_start,
                                       const Sample &line_end);

  // Forward azimuth from -> to in degrees, [0,360)
  static double bearing_deg(const Sample &from, const Sample &to);

  // Signed difference b - a wrapped to (-180,180]
  static double ang_diff_deg(double a, double b);

  // Heading change at b along a -> b -> c, (-180,180]
  static double turn_angle_deg(const Sample &a, const Sample &b,
                               const Sample &c);
};

} // namespace tc
