#pragma once
#include "models/CompressionModel.hpp"
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <vector>

namespace tc {

// One compress + validate round of the policy loop.
struct Attempt {
  double epsilon = 0.0;
  std::size_t compressed_count = 0;
  double compression_ratio = 1.0;
  ValidationResult validation;
};

struct PolicyOutcome {
  bool compressed = false; // false when the track was below min_points
  bool accepted = false;   // last attempt passed validation
  CompressionResult result;
  ValidationResult validation;
  std::vector<Attempt> attempts;

  nlohmann::json to_json() const;
};

// Caller-owned use of the core: compress, validate, and tighten epsilon while
// the validator rejects the result. The core itself never retries.
class CompressionPolicy {
public:
  CompressionPolicy(CompressionParams params, PolicyParams policy,
                    bool verbose = false, std::ostream &log = std::cerr)
      : params_(params), policy_(policy), verbose_(verbose), log_(log) {}

  PolicyOutcome run(const Track &samples) const;

private:
  CompressionParams params_;
  PolicyParams policy_;
  bool verbose_;
  std::ostream &log_;
};

} // namespace tc
