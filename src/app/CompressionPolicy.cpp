#include "app/CompressionPolicy.hpp"
#include "core/TrackCompressor.hpp"
#include "core/TrackValidator.hpp"
#include "models/TrackJson.hpp"
#include <algorithm>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace tc {

nlohmann::json PolicyOutcome::to_json() const {
  nlohmann::json hist = nlohmann::json::array();
  for (const auto &a : attempts)
    hist.push_back({{"epsilon", a.epsilon},
                    {"compressed_count", a.compressed_count},
                    {"compression_ratio", a.compression_ratio},
                    {"validation", a.validation}});
  return {{"compressed", compressed},
          {"accepted", accepted},
          {"result", result},
          {"validation", validation},
          {"attempts", hist}};
}

PolicyOutcome CompressionPolicy::run(const Track &samples) const {
  PolicyOutcome out;
  const std::size_t n = samples.size();

  // only tracks longer than min_points are compressed
  if (n <= static_cast<std::size_t>(std::max(0, policy_.min_points))) {
    log_ << "[INFO] Too few points to compress: " << n << " (<= "
         << policy_.min_points << "), keeping track as recorded\n";
    out.result.kept_indices.resize(n);
    std::iota(out.result.kept_indices.begin(), out.result.kept_indices.end(),
              0);
    out.result.original_count = n;
    out.result.compressed_count = n;
    out.accepted = true;
    return out;
  }

  out.compressed = true;
  double eps = params_.epsilon;
  for (int attempt = 0; attempt <= policy_.max_retries; ++attempt) {
    CompressionParams p = params_;
    p.epsilon = eps;
    const CompressionResult res =
        TrackCompressor::compress(TrackCompressor::make_request(samples, p));
    const ValidationResult val =
        TrackValidator::validate(samples, res.kept_indices);

    out.attempts.push_back(
        {eps, res.compressed_count, res.compression_ratio, val});
    out.result = res;
    out.validation = val;

    // formatted locally so the caller's stream keeps its own precision
    std::ostringstream line;
    line << "[INFO] Track compression completed: original=" << n
         << " compressed=" << res.compressed_count << " ratio=" << std::fixed
         << std::setprecision(1) << res.compression_ratio * 100.0
         << "% epsilon=" << std::setprecision(3) << eps
         << "m time=" << res.elapsed_ms << "ms\n";
    log_ << line.str();
    if (verbose_) {
      log_ << "[DEBUG] key points=" << res.preserved_key_points
           << " elevation error=" << val.elevation_gain_error_pct
           << "% distance error=" << val.distance_error_pct << "%\n";
    }

    if (val.is_valid) {
      out.accepted = true;
      break;
    }
    if (attempt < policy_.max_retries) {
      const double next = eps * policy_.retry_epsilon_factor;
      log_ << "[INFO] Validation failed, retrying with epsilon " << next
           << "m\n";
      eps = next;
    }
  }

  if (!out.accepted)
    log_ << "[INFO] No attempt passed validation after "
         << out.attempts.size() << " tries, keeping the last one\n";
  return out;
}

} // namespace tc
