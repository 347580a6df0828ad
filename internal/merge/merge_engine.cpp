#include "internal/merge/merge_engine.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/remap/remap_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/validate/validation.hpp"

namespace eafkit::merge {
namespace {

void RequireSupported(const MergeOptions& options) {
  if (options.overlap_strategy != OverlapStrategy::kFail) {
    throw util::Unsupported("overlap strategy '" + std::string(ToString(options.overlap_strategy)) + "'");
  }
}

template <typename T>
void Union(std::vector<T>& into, const std::vector<T>& from) {
  for (const auto& item : from) {
    if (std::find(into.begin(), into.end(), item) == into.end()) {
      into.push_back(item);
    }
  }
}

// Gives every annotation a UUID id and rewrites references to match.
void Tag(model::Document& document) {
  std::unordered_map<std::string, std::string> tagged;
  for (auto& tier : document.tiers) {
    auto ids = tier.Tag();
    tagged.insert(ids.begin(), ids.end());
  }

  for (auto& tier : document.tiers) {
    for (auto& annotation : tier.annotations) {
      if (annotation.IsAlignable()) {
        continue;
      }
      // Derivation resolved every parent, so the lookup cannot miss.
      annotation.SetRefId(tagged.at(*annotation.RefId()));
      annotation.SetMainId(tagged.at(*annotation.MainId()));

      if (auto previous = annotation.Previous()) {
        auto it = tagged.find(*previous);
        if (it == tagged.end()) {
          throw util::AnnotationIdInvalid(*previous);
        }
        annotation.SetPrevious(it->second);
      }
    }
  }
}

void SortByStart(model::Tier& tier) {
  std::stable_sort(tier.annotations.begin(), tier.annotations.end(),
                   [](const model::Annotation& a, const model::Annotation& b) { return a.Start() < b.Start(); });
}

} // namespace

model::Tier MergeTiers(const std::vector<model::Tier>& tiers, const MergeOptions& options) {
  RequireSupported(options);
  if (tiers.empty()) {
    throw util::NoData();
  }

  model::Tier merged = tiers.front().Strip();
  for (const auto& tier : tiers) {
    if (tier.IsMain() != merged.IsMain()) {
      throw util::TierTypeMismatch(merged.id, tier.id);
    }
    merged.Extend(tier.annotations);
  }

  SortByStart(merged);
  if (merged.IsMain() && validate::Overlap(merged.annotations)) {
    throw util::AnnotationOverlap(merged.id);
  }
  return merged;
}

core::AnnotationDocument Merge(std::vector<model::Document> documents, const MergeOptions& options) {
  RequireSupported(options);
  if (documents.empty()) {
    throw util::NoData();
  }

  const std::size_t inputs = documents.size();

  model::Document merged;
  merged.author  = documents.front().author;
  merged.date    = documents.front().date;
  merged.format  = documents.front().format;
  merged.version = documents.front().version;

  std::unordered_map<std::string, std::size_t> tier_position;

  for (auto& input : documents) {
    model::Document document = core::AnnotationDocument::Create(std::move(input)).Raw();
    Tag(document);

    Union(merged.linguistic_types, document.linguistic_types);
    Union(merged.locales, document.locales);
    Union(merged.languages, document.languages);
    Union(merged.constraints, document.constraints);
    Union(merged.controlled_vocabularies, document.controlled_vocabularies);

    for (auto& tier : document.tiers) {
      auto it = tier_position.find(tier.id);
      if (it == tier_position.end()) {
        tier_position.emplace(tier.id, merged.tiers.size());
        merged.tiers.push_back(std::move(tier));
        continue;
      }

      auto& existing = merged.tiers[it->second];
      if (existing.IsMain() != tier.IsMain()) {
        throw util::TierTypeMismatch(existing.id, tier.id);
      }
      existing.Extend(tier.annotations);
    }
  }

  for (auto& tier : merged.tiers) {
    SortByStart(tier);
    if (tier.IsMain() && validate::Overlap(tier.annotations)) {
      throw util::AnnotationOverlap(tier.id);
    }
  }

  std::sort(merged.tiers.begin(), merged.tiers.end(), [](const model::Tier& a, const model::Tier& b) { return a.id < b.id; });

  std::size_t slot_count = 0;
  for (auto& tier : merged.tiers) {
    merged.time_order.Join(tier.GenerateTimeSlots(slot_count));
  }

  remap::Remap(merged, index::Build(merged), 1, 1);

  EAFKIT_LOG_DEBUG("merged documents", {observability::IntField("inputs", static_cast<int64_t>(inputs)),
                                        observability::IntField("tiers", static_cast<int64_t>(merged.tiers.size())),
                                        observability::IntField("annotations", static_cast<int64_t>(merged.AnnotationCount()))});

  return core::AnnotationDocument::Create(std::move(merged));
}

} // namespace eafkit::merge
