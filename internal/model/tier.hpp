#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/annotation.hpp"
#include "internal/model/time_order.hpp"

namespace eafkit::model {

// Input tuple for building tiers from plain values.
struct TimedValue {
  std::string value;
  int64_t     start_ms = 0;
  int64_t     end_ms   = 0;
};

struct TierTimedValue {
  std::string tier_id;
  TimedValue  value;
};

/*
  A named layer of annotations.

  parent_ref set: referred tier, every annotation must be referred and
  point into the parent tier. parent_ref empty: main tier, every
  annotation must be alignable.
*/
struct Tier {
  std::string                id;
  std::optional<std::string> participant;
  std::optional<std::string> annotator;
  std::string                linguistic_type_ref = "default-lt";
  std::optional<std::string> default_locale;
  std::optional<std::string> parent_ref;
  std::optional<std::string> ext_ref;
  std::optional<std::string> lang_ref;

  std::vector<Annotation> annotations;

  bool IsMain() const {
    return !parent_ref.has_value();
  }
  bool IsReferred() const {
    return parent_ref.has_value();
  }

  // Any annotation with a previous sibling.
  bool IsTokenized() const;

  bool Empty() const {
    return annotations.empty();
  }
  std::size_t Size() const {
    return annotations.size();
  }

  // Copy without annotations.
  Tier Strip() const;

  void              Add(Annotation annotation);
  void              Extend(const std::vector<Annotation>& more);
  const Annotation* Find(const std::string& annotation_id) const;
  bool              Remove(const std::string& annotation_id);

  // Derived (start, end) of the first / last annotation.
  std::optional<int64_t> Start() const;
  std::optional<int64_t> End() const;

  // (ref, value) slots of alignable annotations, from derived values.
  TimeOrder DeriveTimeSlots() const;

  /*
    Replaces the slot refs of every alignable annotation with a fresh
    "ts<N>" pair valued from the derived start/end. Numbering starts
    after start_index and continues across calls via the return value.
  */
  TimeOrder GenerateTimeSlots(std::size_t& start_index);

  // Assigns a random UUID to each annotation. Returns old id -> new id.
  std::unordered_map<std::string, std::string> Tag();

  // Main tier of alignable annotations "a<start_index+i>" with slots
  // "ts<2(start_index+i)-1>" / "ts<2(start_index+i)>".
  static Tier MainFromValues(const std::vector<TimedValue>& values, const std::string& tier_id, std::size_t start_index = 1);

  // Referred tier aligned 1:1 with the parent's annotations.
  static Tier RefFromValues(const std::vector<std::string>& values, const std::string& tier_id, const Tier& parent,
                            const std::string& linguistic_type_ref, std::size_t start_index);

  bool operator==(const Tier& other) const;
};

} // namespace eafkit::model
