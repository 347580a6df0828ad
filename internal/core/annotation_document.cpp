#include "internal/core/annotation_document.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "internal/derive/derivation_engine.hpp"
#include "internal/extract/extractor.hpp"
#include "internal/merge/merge_engine.hpp"
#include "internal/remap/remap_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/validate/validation.hpp"

namespace eafkit::core {
namespace {

// Slot ids still used by some alignable annotation.
std::unordered_set<std::string> ReferencedSlots(const model::Document& document) {
  std::unordered_set<std::string> used;
  for (const auto& tier : document.tiers) {
    for (const auto& annotation : tier.annotations) {
      if (auto refs = annotation.TimeSlotRefs()) {
        used.insert(refs->first);
        used.insert(refs->second);
      }
    }
  }
  return used;
}

void DropUnreferencedSlots(model::Document& document, const std::vector<std::string>& candidates) {
  const auto used = ReferencedSlots(document);
  for (const auto& slot_id : candidates) {
    if (!used.count(slot_id)) {
      document.time_order.Remove(slot_id);
    }
  }
}

// Main tier overlap check that tolerates unaligned slots.
void CheckMainTierOverlap(const model::Tier& tier) {
  if (!tier.IsMain()) {
    return;
  }
  const bool resolved = std::all_of(tier.annotations.begin(), tier.annotations.end(),
                                    [](const model::Annotation& a) { return a.Start() && a.End(); });
  if (resolved && validate::Overlap(tier.annotations)) {
    throw util::AnnotationOverlap(tier.id);
  }
}

} // namespace

AnnotationDocument::AnnotationDocument(model::Document document, index::ReferenceIndex index)
    : document_(std::move(document)), index_(std::move(index)) {
}

AnnotationDocument AnnotationDocument::Create(model::Document document) {
  auto index = index::Build(document);
  validate::CheckStructure(document, index);
  derive::Derive(document, index);
  return AnnotationDocument(std::move(document), std::move(index));
}

AnnotationDocument AnnotationDocument::FromValues(const std::vector<model::TimedValue>& values, const std::string& tier_id) {
  if (values.empty()) {
    throw util::NoData();
  }

  auto tier = model::Tier::MainFromValues(values, tier_id, 1);
  auto time_order = tier.DeriveTimeSlots();

  auto document = model::DocumentBuilder().WithTimeOrder(std::move(time_order)).AddTier(std::move(tier)).CheckOverlaps(true).Build();
  return Create(std::move(document));
}

AnnotationDocument AnnotationDocument::FromValuesMulti(const std::vector<model::TierTimedValue>& values) {
  if (values.empty()) {
    throw util::NoData();
  }

  std::vector<std::string>                                     order;
  std::unordered_map<std::string, std::vector<model::TimedValue>> grouped;
  for (const auto& value : values) {
    auto [it, inserted] = grouped.try_emplace(value.tier_id);
    if (inserted) {
      order.push_back(value.tier_id);
    }
    it->second.push_back(value.value);
  }

  model::DocumentBuilder builder;
  model::TimeOrder       time_order;
  std::size_t            start_index = 1;
  for (const auto& tier_id : order) {
    const auto& tier_values = grouped.at(tier_id);
    auto        tier        = model::Tier::MainFromValues(tier_values, tier_id, start_index);
    start_index += tier_values.size();
    time_order.Join(tier.DeriveTimeSlots());
    builder.AddTier(std::move(tier));
  }

  return Create(builder.WithTimeOrder(std::move(time_order)).CheckOverlaps(true).Build());
}

AnnotationDocument AnnotationDocument::Merge(std::vector<model::Document> documents, const merge::MergeOptions& options) {
  return merge::Merge(std::move(documents), options);
}

void AnnotationDocument::Commit(model::Document scratch) {
  *this = Create(std::move(scratch));
}

// ------------------------------------------------------------
// Whole document transformations
// ------------------------------------------------------------

void AnnotationDocument::Remap(std::size_t annotation_start, std::size_t timeslot_start) {
  model::Document scratch = document_;
  remap::Remap(scratch, index_, annotation_start, timeslot_start);
  Commit(std::move(scratch));
}

AnnotationDocument AnnotationDocument::Extract(int64_t start_ms, int64_t end_ms) const {
  return extract::Extract(*this, start_ms, end_ms);
}

void AnnotationDocument::Shift(int64_t shift_ms, bool allow_negative) {
  model::Document scratch = document_;
  scratch.time_order.Shift(shift_ms, allow_negative);
  Commit(std::move(scratch));
}

model::Document AnnotationDocument::ToTemplate() const {
  model::Document tmpl = document_;
  tmpl.time_order      = model::TimeOrder();
  for (auto& tier : tmpl.tiers) {
    tier.annotations.clear();
  }
  return tmpl;
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

const model::Tier* AnnotationDocument::GetTier(const std::string& tier_id) const {
  auto it = index_.tier_position.find(tier_id);
  if (it == index_.tier_position.end()) {
    return nullptr;
  }
  return &document_.tiers[it->second];
}

const model::Annotation* AnnotationDocument::GetAnnotation(const std::string& annotation_id) const {
  auto it = index_.annotation_position.find(annotation_id);
  if (it == index_.annotation_position.end()) {
    return nullptr;
  }
  const auto [tier, position] = it->second;
  return &document_.tiers[tier].annotations[position];
}

const model::Annotation* AnnotationDocument::MainAnnotation(const std::string& annotation_id) const {
  const auto* annotation = GetAnnotation(annotation_id);
  if (!annotation || annotation->IsAlignable()) {
    return annotation;
  }
  return GetAnnotation(*annotation->MainId());
}

const model::Tier* AnnotationDocument::MainTier(const std::string& tier_id) const {
  const auto* tier = GetTier(tier_id);
  if (!tier) {
    throw util::TierIdInvalid(tier_id);
  }
  // The hierarchy is acyclic once created.
  while (tier->parent_ref) {
    tier = GetTier(*tier->parent_ref);
  }
  return tier;
}

const model::Tier* AnnotationDocument::ParentTier(const std::string& tier_id) const {
  const auto* tier = GetTier(tier_id);
  if (!tier) {
    throw util::TierIdInvalid(tier_id);
  }
  return tier->parent_ref ? GetTier(*tier->parent_ref) : nullptr;
}

std::vector<const model::Tier*> AnnotationDocument::ChildTiers(const std::string& tier_id) const {
  if (!index_.ContainsTier(tier_id)) {
    throw util::TierIdInvalid(tier_id);
  }
  std::vector<const model::Tier*> children;
  for (const auto& child_id : index_.ChildTiers(tier_id, document_)) {
    children.push_back(GetTier(child_id));
  }
  return children;
}

std::vector<const model::Tier*> AnnotationDocument::MainTiers() const {
  std::vector<const model::Tier*> tiers;
  for (const auto& tier : document_.tiers) {
    if (tier.IsMain()) {
      tiers.push_back(&tier);
    }
  }
  return tiers;
}

std::vector<const model::Tier*> AnnotationDocument::RefTiers() const {
  std::vector<const model::Tier*> tiers;
  for (const auto& tier : document_.tiers) {
    if (tier.IsReferred()) {
      tiers.push_back(&tier);
    }
  }
  return tiers;
}

std::vector<std::string> AnnotationDocument::TierIds() const {
  std::vector<std::string> ids;
  for (const auto& tier : document_.tiers) {
    ids.push_back(tier.id);
  }
  return ids;
}

std::vector<std::string> AnnotationDocument::MainTierIds() const {
  std::vector<std::string> ids;
  for (const auto* tier : MainTiers()) {
    ids.push_back(tier->id);
  }
  return ids;
}

std::vector<std::string> AnnotationDocument::RefTierIds() const {
  std::vector<std::string> ids;
  for (const auto* tier : RefTiers()) {
    ids.push_back(tier->id);
  }
  return ids;
}

Existence AnnotationDocument::Exists(const std::string& id) const {
  return Existence{index_.ContainsTier(id), index_.ContainsAnnotation(id), index_.ContainsTimeslot(id)};
}

bool AnnotationDocument::IsTokenized(const std::string& tier_id, bool recursive) const {
  const auto* tier = GetTier(tier_id);
  if (!tier) {
    throw util::TierIdInvalid(tier_id);
  }
  if (tier->IsTokenized()) {
    return true;
  }
  if (!recursive) {
    return false;
  }
  for (const auto* child : ChildTiers(tier_id)) {
    if (IsTokenized(child->id, true)) {
      return true;
    }
  }
  return false;
}

std::vector<model::Annotation> AnnotationDocument::Annotations(const std::optional<std::string>& tier_id) const {
  if (tier_id) {
    const auto* tier = GetTier(*tier_id);
    if (!tier) {
      throw util::TierIdInvalid(*tier_id);
    }
    return tier->annotations;
  }

  std::vector<model::Annotation> annotations;
  annotations.reserve(AnnotationCount());
  for (const auto& tier : document_.tiers) {
    annotations.insert(annotations.end(), tier.annotations.begin(), tier.annotations.end());
  }
  return annotations;
}

const model::Annotation* AnnotationDocument::FirstAnnotation() const {
  const model::Annotation* first = nullptr;
  for (const auto& tier : document_.tiers) {
    for (const auto& annotation : tier.annotations) {
      if (annotation.Start() && (!first || *annotation.Start() < *first->Start())) {
        first = &annotation;
      }
    }
  }
  return first;
}

const model::Annotation* AnnotationDocument::LastAnnotation() const {
  const model::Annotation* last = nullptr;
  for (const auto& tier : document_.tiers) {
    for (const auto& annotation : tier.annotations) {
      if (annotation.End() && (!last || *annotation.End() > *last->End())) {
        last = &annotation;
      }
    }
  }
  return last;
}

std::optional<int64_t> AnnotationDocument::TimeslotValue(const std::string& time_slot_id) const {
  auto it = index_.timeslot_value.find(time_slot_id);
  if (it == index_.timeslot_value.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> AnnotationDocument::TimeslotId(int64_t value) const {
  auto it = index_.value_timeslot.find(value);
  if (it == index_.value_timeslot.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<int64_t> AnnotationDocument::MinTimeValue() const {
  return document_.time_order.MinValue();
}

std::optional<int64_t> AnnotationDocument::MaxTimeValue() const {
  return document_.time_order.MaxValue();
}

std::size_t AnnotationDocument::AnnotationCount() const {
  return document_.AnnotationCount();
}

std::size_t AnnotationDocument::TierCount() const {
  return document_.tiers.size();
}

// ------------------------------------------------------------
// Mutations
// ------------------------------------------------------------

std::string AnnotationDocument::AddTimeslot(const std::optional<std::string>& time_slot_id, std::optional<int64_t> value) {
  model::Document scratch = document_;
  auto            id      = scratch.time_order.Add(time_slot_id, value);
  Commit(std::move(scratch));
  return id;
}

void AnnotationDocument::AddAnnotation(model::Annotation annotation, const std::string& tier_id) {
  if (index_.ContainsAnnotation(annotation.Id())) {
    throw util::AnnotationIdExists(annotation.Id());
  }

  model::Document scratch = document_;
  model::Tier*    tier    = scratch.FindTier(tier_id);
  if (!tier) {
    throw util::TierIdInvalid(tier_id);
  }
  if (annotation.IsReferred() != tier->IsReferred()) {
    throw util::AnnotationTypeMismatch(annotation.Id(), tier_id);
  }

  auto position = tier->annotations.end();

  if (auto refs = annotation.TimeSlotRefs()) {
    if (!scratch.time_order.Contains(refs->first)) {
      scratch.time_order.Add(refs->first, annotation.Start());
    }
    if (!scratch.time_order.Contains(refs->second)) {
      scratch.time_order.Add(refs->second, annotation.End());
    }

    // Keep the tier sorted by start where times are known.
    const auto values = scratch.time_order.ValueById();
    const auto start  = values.at(refs->first);
    if (start) {
      position = std::find_if(tier->annotations.begin(), tier->annotations.end(), [&](const model::Annotation& existing) {
        return existing.Start() && *existing.Start() > *start;
      });
    }
  } else {
    const auto ref_id = *annotation.RefId();
    if (!index_.ContainsAnnotation(ref_id)) {
      throw util::AnnotationIdInvalid(ref_id);
    }

    // After the last sibling sharing the same parent.
    auto last_sibling = std::find_if(tier->annotations.rbegin(), tier->annotations.rend(),
                                     [&](const model::Annotation& existing) { return existing.RefId() == ref_id; });
    if (last_sibling != tier->annotations.rend()) {
      position = last_sibling.base();
    }
  }

  annotation.ClearDerived();
  tier->annotations.insert(position, std::move(annotation));

  auto updated = Create(std::move(scratch));
  CheckMainTierOverlap(*updated.GetTier(tier_id));
  *this = std::move(updated);
}

void AnnotationDocument::RemoveAnnotation(const std::string& annotation_id) {
  const auto* annotation = GetAnnotation(annotation_id);
  if (!annotation) {
    throw util::AnnotationIdInvalid(annotation_id);
  }

  for (const auto& tier : document_.tiers) {
    for (const auto& other : tier.annotations) {
      if (other.RefId() == annotation_id || other.Previous() == annotation_id) {
        throw util::AnnotationHasDependents(annotation_id, other.Id());
      }
    }
  }

  std::vector<std::string> slots;
  if (auto refs = annotation->TimeSlotRefs()) {
    slots = {refs->first, refs->second};
  }

  model::Document scratch = document_;
  scratch.FindTier(*index_.TierOf(annotation_id))->Remove(annotation_id);
  DropUnreferencedSlots(scratch, slots);
  Commit(std::move(scratch));
}

void AnnotationDocument::AddTier(model::Tier tier, std::optional<model::StereoType> stereotype) {
  if (index_.ContainsTier(tier.id)) {
    throw util::TierIdExists(tier.id);
  }

  model::Document scratch = document_;

  if (tier.IsMain()) {
    for (const auto& slot : tier.DeriveTimeSlots().Slots()) {
      const auto* existing = scratch.time_order.Find(slot.id);
      if (!existing) {
        scratch.time_order.Add(slot.id, slot.value);
      } else if (slot.value && existing->value != slot.value) {
        throw util::TimeslotIdExists(slot.id);
      }
    }
  }

  if (!scratch.HasLinguisticType(tier.linguistic_type_ref)) {
    scratch.linguistic_types.push_back(model::LinguisticType::Create(tier.linguistic_type_ref, stereotype));
  }
  if (stereotype) {
    auto constraint = model::Constraint::FromStereoType(*stereotype);
    if (std::find(scratch.constraints.begin(), scratch.constraints.end(), constraint) == scratch.constraints.end()) {
      scratch.constraints.push_back(std::move(constraint));
    }
  }

  const std::string tier_id = tier.id;
  for (auto& annotation : tier.annotations) {
    annotation.ClearDerived();
  }
  scratch.tiers.push_back(std::move(tier));

  auto updated = Create(std::move(scratch));
  CheckMainTierOverlap(*updated.GetTier(tier_id));
  *this = std::move(updated);
}

void AnnotationDocument::RemoveTier(const std::string& tier_id) {
  const auto* tier = GetTier(tier_id);
  if (!tier) {
    throw util::TierIdInvalid(tier_id);
  }
  if (auto children = index_.ChildTiers(tier_id, document_); !children.empty()) {
    throw util::TierHasDependents(tier_id, children.front());
  }

  std::vector<std::string> slots;
  for (const auto& annotation : tier->annotations) {
    if (auto refs = annotation.TimeSlotRefs()) {
      slots.push_back(refs->first);
      slots.push_back(refs->second);
    }
  }

  model::Document scratch = document_;
  scratch.tiers.erase(scratch.tiers.begin() + static_cast<std::ptrdiff_t>(index_.tier_position.at(tier_id)));
  DropUnreferencedSlots(scratch, slots);
  Commit(std::move(scratch));
}

void AnnotationDocument::AffixTierId(const std::optional<std::string>& tier_id, const std::string& prefix, const std::string& suffix) {
  if (tier_id && !index_.ContainsTier(*tier_id)) {
    throw util::TierIdInvalid(*tier_id);
  }

  std::unordered_map<std::string, std::string> renamed;
  for (const auto& tier : document_.tiers) {
    if (!tier_id || tier.id == *tier_id) {
      renamed.emplace(tier.id, prefix + tier.id + suffix);
    }
  }

  model::Document scratch = document_;
  for (auto& tier : scratch.tiers) {
    if (auto it = renamed.find(tier.id); it != renamed.end()) {
      tier.id = it->second;
    }
    if (tier.parent_ref) {
      if (auto it = renamed.find(*tier.parent_ref); it != renamed.end()) {
        tier.parent_ref = it->second;
      }
    }
  }
  Commit(std::move(scratch));
}

// ------------------------------------------------------------
// Id generation
// ------------------------------------------------------------

std::string AnnotationDocument::GenerateTimeslotId() const {
  return document_.time_order.GenerateId();
}

std::string AnnotationDocument::GenerateAnnotationId() const {
  return GenerateAnnotationIds(1).front();
}

std::vector<std::string> AnnotationDocument::GenerateAnnotationIds(std::size_t count) const {
  int64_t max = 0;
  for (const auto& tier : document_.tiers) {
    for (const auto& annotation : tier.annotations) {
      if (auto number = model::IdNumber(annotation.Id()); number && *number > max) {
        max = *number;
      }
    }
  }

  std::vector<std::string> ids;
  ids.reserve(count);
  for (std::size_t i = 1; i <= count; ++i) {
    ids.push_back("a" + std::to_string(max + static_cast<int64_t>(i)));
  }
  return ids;
}

} // namespace eafkit::core
