#pragma once
#include "models/params.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace tc {

// Driver configuration, normally config/settings.json:
// {
//   "compression": { "epsilon": 5.0, "preserve_elevation_changes": true,
//                    "elevation_threshold": 2.0 },
//   "policy": { "min_points": 100, "max_retries": 3,
//               "retry_epsilon_factor": 0.5 },
//   "log": { "verbose": false }
// }
// Every block and key is optional.
struct Settings {
  CompressionParams compression;
  PolicyParams policy;
  bool verbose = false;

  static Settings from_json(const nlohmann::json &j) {
    Settings s;
    if (j.contains("compression"))
      s.compression = CompressionParams::from_json(j.at("compression"));
    if (j.contains("policy"))
      s.policy = PolicyParams::from_json(j.at("policy"));
    if (j.contains("log"))
      s.verbose = j.at("log").value("verbose", false);
    s.compression.validate();
    s.policy.validate();
    return s;
  }

  static Settings load(const std::string &path) {
    std::ifstream cfg(path);
    if (!cfg)
      throw std::runtime_error("Cannot open " + path);
    nlohmann::json j;
    cfg >> j;
    return from_json(j);
  }
};

} // namespace tc
