#include "core/GeoUtils.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>

namespace tc {

static inline double deg2rad(double d) { return d * (M_PI / 180.0); }

double GeoUtils::haversine(double lat1, double lon1, double lat2,
                           double lon2) {
  double phi1 = deg2rad(lat1);
  double phi2 = deg2rad(lat2);
  double delta_phi = deg2rad(lat2 - lat1);
  double delta_gamma = deg2rad(lon2 - lon1);
  double h = std::pow(std::sin(delta_phi / 2), 2) +
             std::cos(phi1) * std::cos(phi2) *
                 std::pow(std::sin(delta_gamma / 2), 2);
  // rounding can push h a hair above 1 for antipodal points
  h = std::min(1.0, std::max(0.0, h));
  return 2 * kEarthRadiusM * std::asin(std::sqrt(h));
}
double GeoUtils::haversine(const Coordinate &p1, const Coordinate &p2) {
  return haversine(p1.lat, p1.lon, p2.lat, p2.lon);
}
double GeoUtils::haversine(const Sample &p1, const Sample &p2) {
  return haversine(p1.latitude, p1.longitude, p2.latitude, p2.longitude);
}

double GeoUtils::perpendicular_distance(const Sample &point,
                                        const Sample &line_start,
                                        const Sample &line_end) {
  // (lat, lon) treated as planar; fine for the span of one activity
  const Eigen::Vector2d a(line_start.latitude, line_start.longitude);
  const Eigen::Vector2d b(line_end.latitude, line_end.longitude);
  const Eigen::Vector2d p(point.latitude, point.longitude);

  const Eigen::Vector2d ab = b - a;
  const double len_sq = ab.squaredNorm();
  if (len_sq == 0.0)
    return haversine(point, line_start);

  double t = (p - a).dot(ab) / len_sq;
  t = std::max(0.0, std::min(1.0, t));
  const Eigen::Vector2d foot = a + t * ab;
  return haversine(point.latitude, point.longitude, foot.x(), foot.y());
}

double GeoUtils::bearing_deg(const Sample &from, const Sample &to) {
  const double lat1 = deg2rad(from.latitude);
  const double lat2 = deg2rad(to.latitude);
  const double dlon = deg2rad(to.longitude - from.longitude);

  const double y = std::sin(dlon) * std::cos(lat2);
  const double x = std::cos(lat1) * std::sin(lat2) -
                   std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
  double b = std::atan2(y, x) * 180.0 / M_PI;
  if (b < 0)
    b += 360.0;
  // tiny negative angles round up to exactly 360 after the shift
  return b >= 360.0 ? b - 360.0 : b;
}

double GeoUtils::ang_diff_deg(double a, double b) {
  double d = b - a;
  while (d > 180.0)
    d -= 360.0;
  while (d <= -180.0)
    d += 360.0;
  return d;
}

double GeoUtils::turn_angle_deg(const Sample &a, const Sample &b,
                                const Sample &c) {
  return ang_diff_deg(bearing_deg(a, b), bearing_deg(b, c));
}

double Sample::grade_to(const Sample &other) const {
  const double horizontal = GeoUtils::haversine(*this, other);
  if (!(horizontal > 0.0))
    return 0.0;
  const double grade = elevation_change_to(other) / horizontal * 100.0;
  return std::max(-20.0, std::min(20.0, grade));
}

} // namespace tc
