#include "internal/validate/validation.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "internal/index/reference_index.hpp"
#include "internal/util/errors.hpp"

namespace eafkit::validate {

std::vector<Span> Spans(const std::vector<model::Annotation>& annotations) {
  std::vector<Span> spans;
  spans.reserve(annotations.size());
  for (const auto& annotation : annotations) {
    spans.push_back(Span{annotation.Id(), annotation.Start(), annotation.End()});
  }
  return spans;
}

std::vector<Span> ResolveSpans(const model::Tier& tier, const model::TimeOrder& time_order) {
  const auto values = time_order.ValueById();

  std::vector<Span> spans;
  spans.reserve(tier.annotations.size());
  for (const auto& annotation : tier.annotations) {
    auto refs = annotation.TimeSlotRefs();
    if (!refs) {
      throw util::AnnotationTypeMismatch(annotation.Id(), tier.id);
    }
    auto start = values.find(refs->first);
    auto end   = values.find(refs->second);
    if (start == values.end() || end == values.end()) {
      throw util::TimeslotRefMissing(annotation.Id());
    }
    spans.push_back(Span{annotation.Id(), start->second, end->second});
  }
  return spans;
}

bool Overlap(std::vector<Span> spans) {
  for (const auto& span : spans) {
    if (!span.start_ms || !span.end_ms) {
      throw util::TimeslotValMissing(span.annotation_id);
    }
  }

  std::stable_sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) { return *a.start_ms < *b.start_ms; });

  for (std::size_t i = 1; i < spans.size(); ++i) {
    if (*spans[i - 1].end_ms > *spans[i].start_ms) {
      return true;
    }
  }
  return false;
}

bool Overlap(const std::vector<model::Annotation>& annotations) {
  return Overlap(Spans(annotations));
}

bool TimeslotDuplicates(const model::TimeOrder& time_order) {
  return time_order.HasDuplicateIds();
}

std::optional<std::string> TierDuplicates(const std::vector<model::Tier>& tiers) {
  std::unordered_set<std::string> seen;
  for (const auto& tier : tiers) {
    if (!seen.insert(tier.id).second) {
      return tier.id;
    }
  }
  return std::nullopt;
}

std::optional<std::string> TierTypeMismatch(const model::Tier& tier) {
  for (const auto& annotation : tier.annotations) {
    if (annotation.IsReferred() != tier.IsReferred()) {
      return annotation.Id();
    }
  }
  return std::nullopt;
}

bool TierTypeMatches(const model::Tier& tier) {
  return !TierTypeMismatch(tier).has_value();
}

std::optional<std::string> TierHierarchyCycle(const std::vector<model::Tier>& tiers) {
  std::unordered_map<std::string, std::string> parents;
  for (const auto& tier : tiers) {
    if (tier.parent_ref) {
      parents.emplace(tier.id, *tier.parent_ref);
    }
  }

  for (const auto& tier : tiers) {
    std::unordered_set<std::string> visited{tier.id};
    auto                            it = parents.find(tier.id);
    while (it != parents.end()) {
      if (!visited.insert(it->second).second) {
        return tier.id;
      }
      it = parents.find(it->second);
    }
  }
  return std::nullopt;
}

std::vector<std::string> DanglingTimeslotRefs(const model::Document& document) {
  const auto values = document.time_order.ValueById();

  std::vector<std::string> dangling;
  for (const auto& tier : document.tiers) {
    for (const auto& annotation : tier.annotations) {
      if (auto refs = annotation.TimeSlotRefs()) {
        if (!values.count(refs->first) || !values.count(refs->second)) {
          dangling.push_back(annotation.Id());
        }
      }
    }
  }
  return dangling;
}

std::vector<std::string> OverlappingTiers(const model::Document& document) {
  std::vector<std::string> overlapping;
  for (const auto& tier : document.tiers) {
    if (!tier.IsMain()) {
      continue;
    }
    // Annotations on unaligned slots have no span to compare.
    std::vector<Span> resolved;
    for (auto& span : Spans(tier.annotations)) {
      if (span.start_ms && span.end_ms) {
        resolved.push_back(std::move(span));
      }
    }
    if (Overlap(std::move(resolved))) {
      overlapping.push_back(tier.id);
    }
  }
  return overlapping;
}

// ------------------------------------------------------------
// Pre-derivation structure check
// ------------------------------------------------------------

void CheckStructure(const model::Document& document, const index::ReferenceIndex& index) {
  if (TimeslotDuplicates(document.time_order)) {
    throw util::TimeslotIdDuplicated();
  }
  if (!index.duplicate_tier_ids.empty()) {
    throw util::TierIdExists(index.duplicate_tier_ids.front());
  }
  if (!index.duplicate_annotation_ids.empty()) {
    throw util::AnnotationIdExists(index.duplicate_annotation_ids.front());
  }

  for (const auto& tier : document.tiers) {
    if (tier.parent_ref && !index.tier_position.count(*tier.parent_ref)) {
      throw util::TierRefMissingParent(tier.id, *tier.parent_ref);
    }
    if (auto mismatch = TierTypeMismatch(tier)) {
      throw util::AnnotationTypeMismatch(*mismatch, tier.id);
    }
  }

  if (auto cyclic = TierHierarchyCycle(document.tiers)) {
    throw util::TierCycle(*cyclic);
  }

  // Unresolvable refs are left to derivation, which reports them as missing mains.
  for (const auto& tier : document.tiers) {
    if (!tier.parent_ref) {
      continue;
    }
    for (const auto& annotation : tier.annotations) {
      const auto ref_id = annotation.RefId();
      auto       owner  = index.annotation_tier.find(*ref_id);
      if (owner != index.annotation_tier.end() && owner->second != *tier.parent_ref) {
        throw util::AnnotationRefTierMismatch(annotation.Id(), *ref_id, *tier.parent_ref);
      }
    }
  }
}

} // namespace eafkit::validate
