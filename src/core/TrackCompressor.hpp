#pragma once
#include "models/CompressionModel.hpp"
#include "models/CoreTypes.hpp"
#include "models/params.hpp"

namespace tc {

// Entry point of the compression core. Stateless: every call is a pure
// function of its request, so concurrent calls on separate tracks need no
// locking.
class TrackCompressor {
public:
  // Key points unioned with the Douglas-Peucker selection.
  static CompressionResult compress(const CompressionRequest &req);

  // Same selection, returned as copies of the kept samples tagged with
  // is_key_point and their original index.
  static Track compress_samples(const CompressionRequest &req);

  // The request borrows `samples`; a temporary track would dangle.
  static CompressionRequest make_request(const Track &samples,
                                         const CompressionParams &p) {
    return CompressionRequest{samples, p.epsilon, p.preserve_elevation_changes,
                              p.elevation_threshold};
  }
  static CompressionRequest make_request(Track &&samples,
                                         const CompressionParams &p) = delete;
};

} // namespace tc
