#include "internal/derive/derivation_engine.hpp"

#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace eafkit::derive {
namespace {

struct Resolution {
  std::string                tier_id;
  std::optional<int64_t>     start_ms;
  std::optional<int64_t>     end_ms;
  std::optional<std::string> main_id;
};

class Resolver {
 public:
  explicit Resolver(const index::ReferenceIndex& index) : index_(index) {
  }

  std::pair<std::optional<int64_t>, std::optional<int64_t>> Times(const std::string& alignable_id, const std::string& requested_by) const {
    auto refs = index_.annotation_timeslots.find(alignable_id);
    if (refs == index_.annotation_timeslots.end()) {
      throw util::TimeslotRefMissing(requested_by);
    }
    auto start = index_.timeslot_value.find(refs->second.first);
    auto end   = index_.timeslot_value.find(refs->second.second);
    if (start == index_.timeslot_value.end() || end == index_.timeslot_value.end()) {
      throw util::TimeslotRefMissing(requested_by);
    }
    return {start->second, end->second};
  }

  // Follows parent ids until an alignable annotation is reached.
  const std::string& Main(const std::string& annotation_id) {
    if (auto memo = mains_.find(annotation_id); memo != mains_.end()) {
      return memo->second;
    }

    std::vector<std::string>        chain{annotation_id};
    std::unordered_set<std::string> visited{annotation_id};
    std::string                     current = annotation_id;
    std::string                     main;

    while (true) {
      auto parent = index_.annotation_ref.find(current);
      if (parent == index_.annotation_ref.end()) {
        main = current;
        break;
      }

      const std::string& parent_id = parent->second;
      if (!index_.ContainsAnnotation(parent_id)) {
        throw util::AnnotationMainMissing(annotation_id, parent_id);
      }
      if (auto memo = mains_.find(parent_id); memo != mains_.end()) {
        main = memo->second;
        break;
      }
      if (!visited.insert(parent_id).second) {
        throw util::AnnotationRefCycle(annotation_id);
      }
      chain.push_back(parent_id);
      current = parent_id;
    }

    for (const auto& id : chain) {
      mains_.emplace(id, main);
    }
    return mains_.at(annotation_id);
  }

 private:
  const index::ReferenceIndex&                 index_;
  std::unordered_map<std::string, std::string> mains_;
};

} // namespace

void Derive(model::Document& document, const index::ReferenceIndex& index) {
  Resolver                                    resolver(index);
  std::unordered_map<std::string, Resolution> resolved;
  resolved.reserve(index.annotation_position.size());

  std::size_t referred = 0;
  for (const auto& tier : document.tiers) {
    for (const auto& annotation : tier.annotations) {
      Resolution resolution;
      resolution.tier_id = tier.id;

      if (annotation.IsAlignable()) {
        std::tie(resolution.start_ms, resolution.end_ms) = resolver.Times(annotation.Id(), annotation.Id());
      } else {
        const std::string& main = resolver.Main(annotation.Id());
        std::tie(resolution.start_ms, resolution.end_ms) = resolver.Times(main, annotation.Id());
        resolution.main_id = main;
        ++referred;
      }

      resolved.emplace(annotation.Id(), std::move(resolution));
    }
  }

  // Nothing above failed; apply.
  for (auto& tier : document.tiers) {
    for (auto& annotation : tier.annotations) {
      const auto& resolution = resolved.at(annotation.Id());
      annotation.SetTierId(resolution.tier_id);
      annotation.SetTimes(resolution.start_ms, resolution.end_ms);
      annotation.SetMainId(resolution.main_id);
    }
  }

  EAFKIT_LOG_DEBUG("derived document", {observability::IntField("annotations", static_cast<int64_t>(resolved.size())),
                                        observability::IntField("referred", static_cast<int64_t>(referred))});
}

} // namespace eafkit::derive
