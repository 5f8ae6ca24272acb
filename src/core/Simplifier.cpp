#include "core/Simplifier.hpp"
#include "core/GeoUtils.hpp"
#include <algorithm>
#include <functional>
#include <future>
#include <utility>

namespace tc {

Simplifier::Farthest Simplifier::farthest_from_chord(const Track &samples,
                                                     std::size_t start,
                                                     std::size_t end) {
  Farthest best{start, 0.0};
  const Sample &a = samples[start];
  const Sample &b = samples[end];
  for (std::size_t i = start + 1; i < end; ++i) {
    const double d = GeoUtils::perpendicular_distance(samples[i], a, b);
    if (d > best.distance) {
      best.distance = d;
      best.index = i;
    }
  }
  return best;
}

// Split test shared by every variant. `index > start` keeps a degenerate
// tolerance from re-queuing the same span forever.
static inline bool should_split(const Simplifier::Farthest &f,
                                std::size_t start, double epsilon) {
  return f.index > start && f.distance > epsilon;
}

std::vector<std::size_t> Simplifier::simplify(const Track &samples,
                                              double epsilon) {
  if (samples.empty())
    return {};
  return simplify(samples, epsilon, 0, samples.size() - 1);
}

std::vector<std::size_t> Simplifier::simplify(const Track &samples,
                                              double epsilon,
                                              std::size_t start,
                                              std::size_t end) {
  if (samples.empty() || start > end || end >= samples.size())
    return {};
  if (end - start <= 1) {
    std::vector<std::size_t> out{start};
    if (end != start)
      out.push_back(end);
    return out;
  }

  // keep mask over the span, primed with its endpoints; the stack machine
  // runs until every open span is either split or accepted
  const std::size_t len = end - start + 1;
  std::vector<bool> keep(len, false);
  keep.front() = true;
  keep.back() = true;

  std::vector<std::pair<std::size_t, std::size_t>> stack;
  stack.reserve(64);
  stack.push_back({start, end});

  while (!stack.empty()) {
    auto [s, e] = stack.back();
    stack.pop_back();
    if (e - s <= 1)
      continue;

    const Farthest f = farthest_from_chord(samples, s, e);
    if (should_split(f, s, epsilon)) {
      keep[f.index - start] = true;
      stack.push_back({s, f.index});
      stack.push_back({f.index, e});
    }
  }

  std::vector<std::size_t> out;
  for (std::size_t k = 0; k < len; ++k)
    if (keep[k])
      out.push_back(start + k);
  return out;
}

static void recurse(const Track &samples, double epsilon, std::size_t start,
                    std::size_t end, std::vector<std::size_t> &out) {
  if (end - start <= 1) {
    out.push_back(start);
    out.push_back(end);
    return;
  }
  const auto f = Simplifier::farthest_from_chord(samples, start, end);
  if (should_split(f, start, epsilon)) {
    recurse(samples, epsilon, start, f.index, out);
    recurse(samples, epsilon, f.index, end, out);
  } else {
    out.push_back(start);
    out.push_back(end);
  }
}

static void sort_unique(std::vector<std::size_t> &v) {
  std::sort(v.begin(), v.end());
  v.erase(std::unique(v.begin(), v.end()), v.end());
}

std::vector<std::size_t> Simplifier::simplify_recursive(const Track &samples,
                                                        double epsilon,
                                                        std::size_t start,
                                                        std::size_t end) {
  std::vector<std::size_t> out;
  if (samples.empty() || start > end || end >= samples.size())
    return out;
  recurse(samples, epsilon, start, end, out);
  sort_unique(out);
  return out;
}

static std::vector<std::size_t> fork_join(const Track &samples,
                                          double epsilon, std::size_t start,
                                          std::size_t end, int depth) {
  if (end - start < Simplifier::kParallelCutoff ||
      depth >= Simplifier::kMaxForkDepth)
    return Simplifier::simplify(samples, epsilon, start, end);

  const auto f = Simplifier::farthest_from_chord(samples, start, end);
  if (!should_split(f, start, epsilon))
    return {start, end};

  auto left = std::async(std::launch::async, fork_join, std::cref(samples),
                         epsilon, start, f.index, depth + 1);
  std::vector<std::size_t> out =
      fork_join(samples, epsilon, f.index, end, depth + 1);
  std::vector<std::size_t> lhs = left.get();
  out.insert(out.end(), lhs.begin(), lhs.end());
  sort_unique(out);
  return out;
}

std::vector<std::size_t> Simplifier::simplify_parallel(const Track &samples,
                                                       double epsilon) {
  if (samples.empty())
    return {};
  return fork_join(samples, epsilon, 0, samples.size() - 1, 0);
}

} // namespace tc
