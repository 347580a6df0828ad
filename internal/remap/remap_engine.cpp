#include "internal/remap/remap_engine.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace eafkit::remap {
namespace {

const std::string& Renamed(const std::unordered_map<std::string, std::string>& map, const std::string& id) {
  auto it = map.find(id);
  return it == map.end() ? id : it->second;
}

} // namespace

RemapResult Remap(model::Document& document, const index::ReferenceIndex& index, std::size_t annotation_start,
                  std::size_t timeslot_start) {
  model::Document scratch = document;
  RemapResult     result;

  result.timeslot_ids = scratch.time_order.Remap(timeslot_start);

  std::size_t next = annotation_start;
  for (const auto& tier : scratch.tiers) {
    for (const auto& annotation : tier.annotations) {
      result.annotation_ids.emplace(annotation.Id(), "a" + std::to_string(next++));
    }
  }

  for (auto& tier : scratch.tiers) {
    for (auto& annotation : tier.annotations) {
      const std::string old_id = annotation.Id();

      if (annotation.IsAlignable()) {
        auto refs = index.annotation_timeslots.find(old_id);
        if (refs == index.annotation_timeslots.end()) {
          throw util::AnnotationIdInvalid(old_id);
        }
        auto ts1 = result.timeslot_ids.find(refs->second.first);
        auto ts2 = result.timeslot_ids.find(refs->second.second);
        if (ts1 == result.timeslot_ids.end()) {
          throw util::TimeslotIdInvalid(refs->second.first);
        }
        if (ts2 == result.timeslot_ids.end()) {
          throw util::TimeslotIdInvalid(refs->second.second);
        }
        annotation.SetTimeSlotRefs(ts1->second, ts2->second);
      } else {
        annotation.SetRefId(Renamed(result.annotation_ids, *annotation.RefId()));
        if (auto previous = annotation.Previous()) {
          annotation.SetPrevious(Renamed(result.annotation_ids, *previous));
        }
      }

      annotation.SetId(result.annotation_ids.at(old_id));
      if (auto main = annotation.MainId()) {
        annotation.SetMainId(Renamed(result.annotation_ids, *main));
      }
    }
  }

  document = std::move(scratch);

  EAFKIT_LOG_DEBUG("remapped document", {observability::IntField("annotations", static_cast<int64_t>(result.annotation_ids.size())),
                                         observability::IntField("timeslots", static_cast<int64_t>(result.timeslot_ids.size()))});
  return result;
}

} // namespace eafkit::remap
