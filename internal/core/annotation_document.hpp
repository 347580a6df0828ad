#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/index/reference_index.hpp"
#include "internal/merge/merge_options.hpp"
#include "internal/model/document.hpp"

namespace eafkit::core {

struct Existence {
  bool tier       = false;
  bool annotation = false;
  bool timeslot   = false;

  bool Any() const {
    return tier || annotation || timeslot;
  }
};

/*
  An indexed and derived annotation document.

  The only way to obtain one is Create(), which builds the reference
  index, checks structure and derives every annotation, so all derived
  values can be trusted for the lifetime of the object.

  Mutations run on a scratch copy which is re-indexed and re-derived
  before it replaces the current state. A throwing mutation leaves the
  document as it was.

  Not internally synchronized.
*/
class AnnotationDocument {
 public:
  static AnnotationDocument Create(model::Document document);

  // Single main tier from (value, start, end) tuples.
  static AnnotationDocument FromValues(const std::vector<model::TimedValue>& values, const std::string& tier_id = "default");
  // One main tier per distinct tier id, in first seen order.
  static AnnotationDocument FromValuesMulti(const std::vector<model::TierTimedValue>& values);

  static AnnotationDocument Merge(std::vector<model::Document> documents, const merge::MergeOptions& options = {});

  const model::Document& Raw() const {
    return document_;
  }
  const index::ReferenceIndex& Index() const {
    return index_;
  }

  // ------------------------------------------------------------
  // Whole document transformations
  // ------------------------------------------------------------

  void               Remap(std::size_t annotation_start = 1, std::size_t timeslot_start = 1);
  AnnotationDocument Extract(int64_t start_ms, int64_t end_ms) const;
  void               Shift(int64_t shift_ms, bool allow_negative);

  // Copy without annotations and time slots.
  model::Document ToTemplate() const;

  // ------------------------------------------------------------
  // Queries
  // ------------------------------------------------------------

  const model::Tier*       GetTier(const std::string& tier_id) const;
  const model::Annotation* GetAnnotation(const std::string& annotation_id) const;

  // Alignable annotation at the end of the reference chain (itself if alignable).
  const model::Annotation* MainAnnotation(const std::string& annotation_id) const;
  // Main tier at the top of the tier hierarchy (itself if main).
  const model::Tier*       MainTier(const std::string& tier_id) const;
  // nullptr for main tiers.
  const model::Tier*       ParentTier(const std::string& tier_id) const;

  std::vector<const model::Tier*> ChildTiers(const std::string& tier_id) const;
  std::vector<const model::Tier*> MainTiers() const;
  std::vector<const model::Tier*> RefTiers() const;

  std::vector<std::string> TierIds() const;
  std::vector<std::string> MainTierIds() const;
  std::vector<std::string> RefTierIds() const;

  Existence Exists(const std::string& id) const;

  bool IsTokenized(const std::string& tier_id, bool recursive) const;

  // All annotations in document order, or those of one tier.
  std::vector<model::Annotation> Annotations(const std::optional<std::string>& tier_id = std::nullopt) const;

  // Earliest start / latest end among annotations with known times.
  const model::Annotation* FirstAnnotation() const;
  const model::Annotation* LastAnnotation() const;

  std::optional<int64_t>     TimeslotValue(const std::string& time_slot_id) const;
  std::optional<std::string> TimeslotId(int64_t value) const;
  std::optional<int64_t>     MinTimeValue() const;
  std::optional<int64_t>     MaxTimeValue() const;

  std::size_t AnnotationCount() const;
  std::size_t TierCount() const;

  // ------------------------------------------------------------
  // Mutations
  // ------------------------------------------------------------

  std::string AddTimeslot(const std::optional<std::string>& time_slot_id, std::optional<int64_t> value);

  /*
    Alignable annotations reuse existing slots named by their refs and add
    the missing ones, valued from the annotation's start/end. Referred
    annotations must point at an existing annotation in the parent tier.
  */
  void AddAnnotation(model::Annotation annotation, const std::string& tier_id);
  void RemoveAnnotation(const std::string& annotation_id);

  // Adds the linguistic type (and constraint) the tier names when missing.
  void AddTier(model::Tier tier, std::optional<model::StereoType> stereotype = std::nullopt);
  void RemoveTier(const std::string& tier_id);

  // Renames one tier, or all tiers when tier_id is empty, to prefix + id + suffix.
  void AffixTierId(const std::optional<std::string>& tier_id, const std::string& prefix, const std::string& suffix);

  // ------------------------------------------------------------
  // Id generation
  // ------------------------------------------------------------

  std::string              GenerateTimeslotId() const;
  std::string              GenerateAnnotationId() const;
  std::vector<std::string> GenerateAnnotationIds(std::size_t count) const;

 private:
  AnnotationDocument(model::Document document, index::ReferenceIndex index);

  void Commit(model::Document scratch);

  model::Document       document_;
  index::ReferenceIndex index_;
};

} // namespace eafkit::core
