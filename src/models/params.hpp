#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace tc {

// User-supplied parameters controlling the compression algorithm.
struct CompressionParams {
  double epsilon = 5.0; // metres of perpendicular tolerance
  bool preserve_elevation_changes = true;
  double elevation_threshold = 2.0; // metres

  static CompressionParams from_json(const nlohmann::json &j) {
    CompressionParams p;
    if (j.contains("epsilon"))
      p.epsilon = j.at("epsilon").get<double>();
    if (j.contains("preserve_elevation_changes"))
      p.preserve_elevation_changes =
          j.at("preserve_elevation_changes").get<bool>();
    if (j.contains("elevation_threshold"))
      p.elevation_threshold = j.at("elevation_threshold").get<double>();
    return p;
  }

  nlohmann::json to_json() const {
    return {{"epsilon", epsilon},
            {"preserve_elevation_changes", preserve_elevation_changes},
            {"elevation_threshold", elevation_threshold}};
  }

  // Throws std::invalid_argument on values the algorithm cannot honour.
  void validate() const {
    if (!(epsilon > 0.0))
      throw std::invalid_argument("epsilon must be > 0, got " +
                                  std::to_string(epsilon));
    if (!(elevation_threshold >= 0.0))
      throw std::invalid_argument("elevation_threshold must be >= 0, got " +
                                  std::to_string(elevation_threshold));
  }
};

// Caller-side policy: when to compress and how to react to a failed
// validation.
struct PolicyParams {
  int min_points = 100;              // compress only when N > min_points
  int max_retries = 3;              // extra attempts after the first
  double retry_epsilon_factor = 0.5; // epsilon multiplier per retry

  static PolicyParams from_json(const nlohmann::json &j) {
    PolicyParams p;
    if (j.contains("min_points"))
      p.min_points = j.at("min_points").get<int>();
    if (j.contains("max_retries"))
      p.max_retries = j.at("max_retries").get<int>();
    if (j.contains("retry_epsilon_factor"))
      p.retry_epsilon_factor = j.at("retry_epsilon_factor").get<double>();
    return p;
  }

  void validate() const {
    if (max_retries < 0)
      throw std::invalid_argument("max_retries must be >= 0");
    if (!(retry_epsilon_factor > 0.0 && retry_epsilon_factor < 1.0))
      throw std::invalid_argument("retry_epsilon_factor must be in (0,1), got " +
                                  std::to_string(retry_epsilon_factor));
  }
};

} // namespace tc
