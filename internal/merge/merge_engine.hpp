#pragma once

#include <vector>

#include "internal/core/annotation_document.hpp"
#include "internal/merge/merge_options.hpp"
#include "internal/model/document.hpp"
#include "internal/model/tier.hpp"

namespace eafkit::merge {

/*
  Merges documents into one.

  Each input is indexed and derived on its own, then every annotation is
  tagged with a fresh UUID so ids from different inputs cannot collide.
  Metadata is unioned by value, tiers by id (the first contributor's tier
  attributes win). Merged tiers are sorted by start time, the time order
  is regenerated from derived values, tiers are sorted by id and the
  result is renumbered from a1 / ts1.

  Errors: NoData on empty input, TierTypeMismatch when a tier id is main
  in one input and referred in another, AnnotationOverlap for overlapping
  annotations in a merged main tier, Unsupported for any overlap strategy
  other than kFail.
*/
core::AnnotationDocument Merge(std::vector<model::Document> documents, const MergeOptions& options = {});

/*
  Merges tiers of the same kind into one, keeping the first tier's
  attributes. Annotation ids are kept; callers make them unique.
  Requires derived values.
*/
model::Tier MergeTiers(const std::vector<model::Tier>& tiers, const MergeOptions& options = {});

} // namespace eafkit::merge
