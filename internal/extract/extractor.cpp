#include "internal/extract/extractor.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/remap/remap_engine.hpp"
#include "internal/util/errors.hpp"

namespace eafkit::extract {

core::AnnotationDocument Extract(const core::AnnotationDocument& source, int64_t start_ms, int64_t end_ms) {
  if (end_ms < start_ms) {
    throw util::TimeSpanInvalid(start_ms, end_ms);
  }

  const auto&     source_index = source.Index();
  model::Document extracted    = source.Raw();
  extracted.time_order = source.Raw().time_order.Filter(start_ms, end_ms);

  const auto kept_slots = extracted.time_order.ValueById();

  auto outside = [&](const model::Annotation& annotation) {
    const std::string& main = annotation.IsAlignable() ? annotation.Id() : *annotation.MainId();
    auto               refs = source_index.annotation_timeslots.find(main);
    if (refs == source_index.annotation_timeslots.end()) {
      return true;
    }
    return !kept_slots.count(refs->second.first) || !kept_slots.count(refs->second.second);
  };

  for (auto& tier : extracted.tiers) {
    tier.annotations.erase(std::remove_if(tier.annotations.begin(), tier.annotations.end(), outside), tier.annotations.end());
  }

  remap::Remap(extracted, index::Build(extracted), 1, 1);
  extracted.time_order.Shift(-start_ms, false);

  EAFKIT_LOG_DEBUG("extracted window", {observability::IntField("start_ms", start_ms), observability::IntField("end_ms", end_ms),
                                        observability::IntField("annotations", static_cast<int64_t>(extracted.AnnotationCount()))});

  return core::AnnotationDocument::Create(std::move(extracted));
}

} // namespace eafkit::extract
