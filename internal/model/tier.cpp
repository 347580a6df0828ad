#include "internal/model/tier.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace eafkit::model {

bool Tier::IsTokenized() const {
  return std::any_of(annotations.begin(), annotations.end(), [](const Annotation& a) { return a.Previous().has_value(); });
}

Tier Tier::Strip() const {
  Tier stripped = *this;
  stripped.annotations.clear();
  return stripped;
}

void Tier::Add(Annotation annotation) {
  annotations.push_back(std::move(annotation));
}

void Tier::Extend(const std::vector<Annotation>& more) {
  annotations.insert(annotations.end(), more.begin(), more.end());
}

const Annotation* Tier::Find(const std::string& annotation_id) const {
  auto it = std::find_if(annotations.begin(), annotations.end(), [&](const Annotation& a) { return a.Id() == annotation_id; });
  return it == annotations.end() ? nullptr : &*it;
}

bool Tier::Remove(const std::string& annotation_id) {
  auto it = std::find_if(annotations.begin(), annotations.end(), [&](const Annotation& a) { return a.Id() == annotation_id; });
  if (it == annotations.end()) {
    return false;
  }
  annotations.erase(it);
  return true;
}

std::optional<int64_t> Tier::Start() const {
  return annotations.empty() ? std::nullopt : annotations.front().Start();
}

std::optional<int64_t> Tier::End() const {
  return annotations.empty() ? std::nullopt : annotations.back().End();
}

TimeOrder Tier::DeriveTimeSlots() const {
  std::vector<TimeSlot> slots;
  for (const auto& annotation : annotations) {
    if (auto refs = annotation.TimeSlotRefs()) {
      slots.push_back(TimeSlot{refs->first, annotation.Start()});
      slots.push_back(TimeSlot{refs->second, annotation.End()});
    }
  }
  return TimeOrder(std::move(slots));
}

TimeOrder Tier::GenerateTimeSlots(std::size_t& start_index) {
  std::vector<TimeSlot> slots;
  for (auto& annotation : annotations) {
    if (!annotation.IsAlignable()) {
      continue;
    }
    std::string ts1 = "ts" + std::to_string(++start_index);
    std::string ts2 = "ts" + std::to_string(++start_index);
    slots.push_back(TimeSlot{ts1, annotation.Start()});
    slots.push_back(TimeSlot{ts2, annotation.End()});
    annotation.SetTimeSlotRefs(std::move(ts1), std::move(ts2));
  }
  return TimeOrder(std::move(slots));
}

std::unordered_map<std::string, std::string> Tier::Tag() {
  std::unordered_map<std::string, std::string> tagged;
  tagged.reserve(annotations.size());
  for (auto& annotation : annotations) {
    std::string uuid = util::GenerateUUIDString();
    tagged.emplace(annotation.Id(), uuid);
    annotation.SetId(std::move(uuid));
  }
  return tagged;
}

// ------------------------------------------------------------
// Builders
// ------------------------------------------------------------

Tier Tier::MainFromValues(const std::vector<TimedValue>& values, const std::string& tier_id, std::size_t start_index) {
  // Slot ids are derived as ts<2n-1>, ts<2n>.
  if (start_index == 0) {
    throw util::InvalidArgument("main tier start index must be at least 1");
  }

  Tier tier;
  tier.id = tier_id;

  for (std::size_t i = 0; i < values.size(); ++i) {
    const auto& value = values[i];
    if (value.end_ms < value.start_ms) {
      throw util::TimeSpanInvalid(value.start_ms, value.end_ms);
    }

    const std::size_t n          = start_index + i;
    auto              annotation = Annotation::Alignable("a" + std::to_string(n), value.value, "ts" + std::to_string(n * 2 - 1),
                                                         "ts" + std::to_string(n * 2));
    annotation.SetTierId(tier_id);
    annotation.SetTimes(value.start_ms, value.end_ms);
    tier.Add(std::move(annotation));
  }
  return tier;
}

Tier Tier::RefFromValues(const std::vector<std::string>& values, const std::string& tier_id, const Tier& parent,
                         const std::string& linguistic_type_ref, std::size_t start_index) {
  if (values.size() > parent.annotations.size()) {
    throw util::TierAlignment(parent.id, tier_id);
  }

  Tier tier;
  tier.id                  = tier_id;
  tier.parent_ref          = parent.id;
  tier.linguistic_type_ref = linguistic_type_ref;

  for (std::size_t i = 0; i < values.size(); ++i) {
    const auto& parent_annotation = parent.annotations[i];
    auto        annotation = Annotation::Referred("a" + std::to_string(start_index + i), values[i], parent_annotation.Id());
    annotation.SetTierId(tier_id);
    annotation.SetTimes(parent_annotation.Start(), parent_annotation.End());
    tier.Add(std::move(annotation));
  }
  return tier;
}

bool Tier::operator==(const Tier& other) const {
  return id == other.id && participant == other.participant && annotator == other.annotator &&
         linguistic_type_ref == other.linguistic_type_ref && default_locale == other.default_locale && parent_ref == other.parent_ref &&
         ext_ref == other.ext_ref && lang_ref == other.lang_ref && annotations == other.annotations;
}

} // namespace eafkit::model
