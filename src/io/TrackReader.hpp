#pragma once
#include "models/CoreTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace tc {

// Loads a recorded track from JSON. Accepted layouts:
//   [ {sample}, {sample}, ... ]
//   { "samples": [ {sample}, ... ], ... }
// Sample keys are documented in models/TrackJson.hpp.
class TrackReader {
public:
  // Throws std::runtime_error for a missing file, nlohmann::json::parse_error
  // for malformed text.
  static Track read_file(const std::string &path);
  static Track from_text(const std::string &text);
  // Throws std::runtime_error naming the first bad sample index.
  static Track from_json(const nlohmann::json &doc);

  static std::string slurp(const std::string &path);
};

} // namespace tc
