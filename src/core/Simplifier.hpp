#pragma once
#include "models/CoreTypes.hpp"
#include <cstddef>
#include <vector>

namespace tc {

// Douglas-Peucker reduction over index ranges of the original track, so the
// output is directly a set of original indices.
//
// All three entry points return the same sorted, duplicate-free index set for
// the span [start, end] (both inclusive):
//   simplify            explicit stack, production path
//   simplify_recursive  literal recursion, reference for tests
//   simplify_parallel   fork-join over independent sub-spans
class Simplifier {
public:
  // spans at least this long are handed to another thread
  static constexpr std::size_t kParallelCutoff = 4096;
  static constexpr int kMaxForkDepth = 4;

  static std::vector<std::size_t> simplify(const Track &samples,
                                           double epsilon);
  static std::vector<std::size_t> simplify(const Track &samples,
                                           double epsilon, std::size_t start,
                                           std::size_t end);

  static std::vector<std::size_t> simplify_recursive(const Track &samples,
                                                     double epsilon,
                                                     std::size_t start,
                                                     std::size_t end);

  static std::vector<std::size_t> simplify_parallel(const Track &samples,
                                                    double epsilon);

  struct Farthest {
    std::size_t index; // == start when the span has no interior point
    double distance;
  };
  // Interior sample of (start, end) farthest from the chord; first wins ties.
  static Farthest farthest_from_chord(const Track &samples, std::size_t start,
                                      std::size_t end);
};

} // namespace tc
