#include "internal/index/reference_index.hpp"

#include "internal/observability/logging.hpp"

namespace eafkit::index {

std::optional<std::string> ReferenceIndex::TierOf(const std::string& annotation_id) const {
  auto it = annotation_tier.find(annotation_id);
  if (it == annotation_tier.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> ReferenceIndex::ParentOf(const std::string& annotation_id) const {
  auto it = annotation_ref.find(annotation_id);
  if (it == annotation_ref.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> ReferenceIndex::ChildTiers(const std::string& tier_id, const model::Document& document) const {
  std::vector<std::string> children;
  for (const auto& tier : document.tiers) {
    if (tier.parent_ref && *tier.parent_ref == tier_id) {
      children.push_back(tier.id);
    }
  }
  return children;
}

ReferenceIndex Build(const model::Document& document) {
  ReferenceIndex index;

  for (const auto& slot : document.time_order.Slots()) {
    index.timeslot_value.emplace(slot.id, slot.value);
    if (slot.value) {
      index.value_timeslot.emplace(*slot.value, slot.id);
    }
  }

  for (std::size_t t = 0; t < document.tiers.size(); ++t) {
    const auto& tier = document.tiers[t];

    if (!index.tier_position.emplace(tier.id, t).second) {
      index.duplicate_tier_ids.push_back(tier.id);
    }
    if (tier.parent_ref) {
      index.tier_parent.emplace(tier.id, *tier.parent_ref);
    }

    auto& ids = index.tier_annotations[tier.id];
    ids.reserve(ids.size() + tier.annotations.size());

    for (std::size_t a = 0; a < tier.annotations.size(); ++a) {
      const auto& annotation = tier.annotations[a];
      const auto& id         = annotation.Id();

      if (!index.annotation_position.emplace(id, std::make_pair(t, a)).second) {
        index.duplicate_annotation_ids.push_back(id);
        continue;
      }

      ids.push_back(id);
      index.annotation_tier.emplace(id, tier.id);

      if (auto refs = annotation.TimeSlotRefs()) {
        index.annotation_timeslots.emplace(id, std::move(*refs));
      } else if (auto ref_id = annotation.RefId()) {
        index.annotation_ref.emplace(id, std::move(*ref_id));
      }
    }
  }

  EAFKIT_LOG_DEBUG("reference index built",
                   {observability::IntField("tiers", static_cast<int64_t>(index.tier_position.size())),
                    observability::IntField("annotations", static_cast<int64_t>(index.annotation_position.size())),
                    observability::IntField("timeslots", static_cast<int64_t>(index.timeslot_value.size()))});
  return index;
}

} // namespace eafkit::index
