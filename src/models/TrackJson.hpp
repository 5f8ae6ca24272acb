#pragma once

#include "models/CompressionModel.hpp"
#include "models/CoreTypes.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace tc {

using Json = nlohmann::json;

// Numbers sometimes arrive as strings in exported tracks.
inline std::optional<double> parse_double(const Json &x) {
  if (x.is_number())
    return x.get<double>();
  if (x.is_string()) {
    try {
      return std::stod(x.get<std::string>());
    } catch (const std::exception &) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

inline std::optional<double> optional_number(const Json &j,
                                             const char *key) {
  if (!j.contains(key) || j[key].is_null())
    return std::nullopt;
  return parse_double(j[key]);
}

inline double required_number(const Json &j, const char *key) {
  auto v = optional_number(j, key);
  if (!v)
    throw std::runtime_error(std::string("missing or non-numeric '") + key +
                             "'");
  return *v;
}

// --- Sample ----
inline void from_json(const Json &j, Sample &s) {
  if (!j.is_object())
    throw std::runtime_error("sample is not an object");
  s.latitude = required_number(j, "lat");
  s.longitude = required_number(j, "lon");

  // accept the usual GPX spellings for altitude
  if (j.contains("alt"))
    s.raw_altitude = required_number(j, "alt");
  else if (j.contains("ele"))
    s.raw_altitude = required_number(j, "ele");
  else if (j.contains("elv"))
    s.raw_altitude = required_number(j, "elv");
  else if (j.contains("elevation"))
    s.raw_altitude = required_number(j, "elevation");
  else
    throw std::runtime_error("missing 'alt'");

  s.timestamp = optional_number(j, "time").value_or(0.0);
  s.barometric_altitude = optional_number(j, "baro_alt");
  s.fused_altitude = optional_number(j, "fused_alt");
  s.elevation_confidence = optional_number(j, "elevation_confidence");
  s.elevation_accuracy = optional_number(j, "elevation_accuracy");
  s.horizontal_accuracy = optional_number(j, "h_acc").value_or(0.0);
  s.vertical_accuracy = optional_number(j, "v_acc").value_or(0.0);
  // producer contract: speed is never negative
  s.speed = std::max(0.0, optional_number(j, "speed").value_or(0.0));
  s.course = optional_number(j, "course").value_or(-1.0);
}

inline void to_json(Json &j, const Sample &s) {
  j = Json{{"time", s.timestamp},
           {"lat", s.latitude},
           {"lon", s.longitude},
           {"alt", s.raw_altitude},
           {"best_alt", s.best_altitude()},
           {"h_acc", s.horizontal_accuracy},
           {"v_acc", s.vertical_accuracy},
           {"speed", s.speed},
           {"course", s.course}};
  if (s.barometric_altitude)
    j["baro_alt"] = *s.barometric_altitude;
  if (s.fused_altitude)
    j["fused_alt"] = *s.fused_altitude;
  if (s.elevation_confidence)
    j["elevation_confidence"] = *s.elevation_confidence;
  if (s.elevation_accuracy)
    j["elevation_accuracy"] = *s.elevation_accuracy;
  if (s.is_key_point)
    j["key_point"] = true;
  if (s.compression_index)
    j["index"] = *s.compression_index;
}

// --- CompressionResult ----
inline void to_json(Json &j, const CompressionResult &r) {
  j = Json{{"kept_indices", r.kept_indices},
           {"original_count", r.original_count},
           {"compressed_count", r.compressed_count},
           {"compression_ratio", r.compression_ratio},
           {"preserved_key_points", r.preserved_key_points},
           {"elapsed_ms", r.elapsed_ms}};
}

inline void from_json(const Json &j, CompressionResult &r) {
  r.kept_indices =
      j.value("kept_indices", std::vector<std::size_t>{});
  r.original_count = j.value("original_count", std::size_t{0});
  r.compressed_count = j.value("compressed_count", r.kept_indices.size());
  r.compression_ratio = j.value("compression_ratio", 1.0);
  r.preserved_key_points = j.value("preserved_key_points", std::size_t{0});
  r.elapsed_ms = j.value("elapsed_ms", 0.0);
}

// --- ValidationResult ----
inline void to_json(Json &j, const ValidationResult &v) {
  j = Json{{"elevation_gain_error", v.elevation_gain_error},
           {"elevation_gain_error_pct", v.elevation_gain_error_pct},
           {"distance_error", v.distance_error},
           {"distance_error_pct", v.distance_error_pct},
           {"is_valid", v.is_valid}};
}

} // namespace tc
