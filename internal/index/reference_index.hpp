#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/model/document.hpp"

namespace eafkit::index {

/*
  Lookup tables over one document snapshot.

  Built in a single pass over tiers then annotations in document order.
  Never fails: duplicate ids are recorded, not rejected, and left for
  validation to report. Any mutation of the document makes the index
  stale; rebuild it wholesale.
*/
struct ReferenceIndex {
  // annotation id -> tier id
  std::unordered_map<std::string, std::string> annotation_tier;
  // referred annotation id -> parent annotation id
  std::unordered_map<std::string, std::string> annotation_ref;
  // tier id -> annotation ids, document order
  std::unordered_map<std::string, std::vector<std::string>> tier_annotations;
  // referred tier id -> parent tier id
  std::unordered_map<std::string, std::string> tier_parent;
  // slot id -> value
  std::unordered_map<std::string, std::optional<int64_t>> timeslot_value;
  // value -> slot id, first slot wins
  std::unordered_map<int64_t, std::string> value_timeslot;
  // alignable annotation id -> (time_slot_ref1, time_slot_ref2)
  std::unordered_map<std::string, std::pair<std::string, std::string>> annotation_timeslots;
  // annotation id -> (tier position, annotation position)
  std::unordered_map<std::string, std::pair<std::size_t, std::size_t>> annotation_position;
  // tier id -> tier position
  std::unordered_map<std::string, std::size_t> tier_position;

  std::vector<std::string> duplicate_annotation_ids;
  std::vector<std::string> duplicate_tier_ids;

  bool ContainsAnnotation(const std::string& annotation_id) const {
    return annotation_position.count(annotation_id) > 0;
  }
  bool ContainsTier(const std::string& tier_id) const {
    return tier_position.count(tier_id) > 0;
  }
  bool ContainsTimeslot(const std::string& time_slot_id) const {
    return timeslot_value.count(time_slot_id) > 0;
  }

  std::optional<std::string> TierOf(const std::string& annotation_id) const;
  std::optional<std::string> ParentOf(const std::string& annotation_id) const;

  // Direct child tiers of tier_id, document order.
  std::vector<std::string> ChildTiers(const std::string& tier_id, const model::Document& document) const;
};

ReferenceIndex Build(const model::Document& document);

} // namespace eafkit::index
