#pragma once

#include <string_view>

namespace eafkit::merge {

// What to do with overlapping annotations in a merged main tier.
enum class OverlapStrategy {
  kFail,
  kJoin,
  kDiscardFirst,
  kDiscardLast,
  kPrioritizeFirst,
  kPrioritizeLast,
};

constexpr std::string_view ToString(OverlapStrategy strategy) {
  switch (strategy) {
    case OverlapStrategy::kFail:
      return "fail";
    case OverlapStrategy::kJoin:
      return "join";
    case OverlapStrategy::kDiscardFirst:
      return "discard_first";
    case OverlapStrategy::kDiscardLast:
      return "discard_last";
    case OverlapStrategy::kPrioritizeFirst:
      return "prioritize_first";
    case OverlapStrategy::kPrioritizeLast:
      return "prioritize_last";
  }
  return "fail";
}

struct MergeOptions {
  // Only kFail is implemented; the others are rejected as unsupported.
  OverlapStrategy overlap_strategy = OverlapStrategy::kFail;
};

} // namespace eafkit::merge
