#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/annotation.hpp"
#include "internal/model/document.hpp"
#include "internal/model/tier.hpp"
#include "internal/model/time_order.hpp"

namespace eafkit::index {
struct ReferenceIndex;
}

namespace eafkit::validate {

// Time span of one annotation, as far as it is known.
struct Span {
  std::string            annotation_id;
  std::optional<int64_t> start_ms;
  std::optional<int64_t> end_ms;
};

// Spans from derived annotation values.
std::vector<Span> Spans(const std::vector<model::Annotation>& annotations);

// Spans of a main tier resolved through the time order, before derivation.
// TimeslotRefMissing when a slot ref does not exist.
std::vector<Span> ResolveSpans(const model::Tier& tier, const model::TimeOrder& time_order);

/*
  True if any two spans overlap once sorted by start, i.e. a span ends
  after the next one starts. Touching spans do not overlap.
  Every span must be resolved: TimeslotValMissing otherwise.
*/
bool Overlap(std::vector<Span> spans);
bool Overlap(const std::vector<model::Annotation>& annotations);

bool TimeslotDuplicates(const model::TimeOrder& time_order);

// First repeated tier id.
std::optional<std::string> TierDuplicates(const std::vector<model::Tier>& tiers);

// First annotation whose kind does not fit the tier kind.
std::optional<std::string> TierTypeMismatch(const model::Tier& tier);
bool                       TierTypeMatches(const model::Tier& tier);

// Some tier that is its own ancestor.
std::optional<std::string> TierHierarchyCycle(const std::vector<model::Tier>& tiers);

// Ids of alignable annotations referring to a slot that is not in the time order.
std::vector<std::string> DanglingTimeslotRefs(const model::Document& document);

// Ids of main tiers with overlapping annotations. Requires derived values;
// annotations without a resolved span are skipped.
std::vector<std::string> OverlappingTiers(const model::Document& document);

/*
  Whole document structure check run before derivation. Throws on:
  duplicate slot / tier / annotation ids, referred tiers without parent,
  tier cycles, annotation kind vs tier kind, and referred annotations
  pointing outside their parent tier.
*/
void CheckStructure(const model::Document& document, const index::ReferenceIndex& index);

} // namespace eafkit::validate
