#include "internal/model/time_order.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace eafkit::model {

namespace {

bool AddOverflows(int64_t value, int64_t delta) {
  if (delta > 0) {
    return value > std::numeric_limits<int64_t>::max() - delta;
  }
  return value < std::numeric_limits<int64_t>::min() - delta;
}

} // namespace

std::optional<int64_t> IdNumber(const std::string& id) {
  std::size_t pos = 0;
  while (pos < id.size() && !std::isdigit(static_cast<unsigned char>(id[pos]))) {
    ++pos;
  }
  if (pos == id.size()) {
    return std::nullopt;
  }
  for (std::size_t i = pos; i < id.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(id[i]))) {
      return std::nullopt;
    }
  }
  try {
    return std::stoll(id.substr(pos));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

TimeOrder::TimeOrder(std::vector<TimeSlot> slots) : slots_(std::move(slots)) {
}

TimeOrder TimeOrder::FromValues(const std::vector<int64_t>& values, std::size_t start) {
  std::vector<TimeSlot> slots;
  slots.reserve(values.size());
  for (std::size_t i = 0; i < values.size(); ++i) {
    slots.push_back(TimeSlot{"ts" + std::to_string(start + i), values[i]});
  }
  return TimeOrder(std::move(slots));
}

bool TimeOrder::Contains(const std::string& id) const {
  return Find(id) != nullptr;
}

const TimeSlot* TimeOrder::Find(const std::string& id) const {
  auto it = std::find_if(slots_.begin(), slots_.end(), [&](const TimeSlot& slot) { return slot.id == id; });
  return it == slots_.end() ? nullptr : &*it;
}

std::string TimeOrder::Add(const std::optional<std::string>& id, std::optional<int64_t> value) {
  std::string slot_id = id ? *id : GenerateId();
  if (Contains(slot_id)) {
    throw util::TimeslotIdExists(slot_id);
  }
  slots_.push_back(TimeSlot{slot_id, value});
  return slot_id;
}

void TimeOrder::Join(const TimeOrder& other) {
  for (const auto& slot : other.slots_) {
    if (Contains(slot.id)) {
      throw util::TimeslotIdExists(slot.id);
    }
  }
  slots_.insert(slots_.end(), other.slots_.begin(), other.slots_.end());
}

bool TimeOrder::Remove(const std::string& id) {
  auto it = std::find_if(slots_.begin(), slots_.end(), [&](const TimeSlot& slot) { return slot.id == id; });
  if (it == slots_.end()) {
    return false;
  }
  slots_.erase(it);
  return true;
}

std::optional<int64_t> TimeOrder::MinValue() const {
  std::optional<int64_t> min;
  for (const auto& slot : slots_) {
    if (slot.value && (!min || *slot.value < *min)) {
      min = slot.value;
    }
  }
  return min;
}

std::optional<int64_t> TimeOrder::MaxValue() const {
  std::optional<int64_t> max;
  for (const auto& slot : slots_) {
    if (slot.value && (!max || *slot.value > *max)) {
      max = slot.value;
    }
  }
  return max;
}

std::string TimeOrder::GenerateId() const {
  return GenerateIds(1).front();
}

std::vector<std::string> TimeOrder::GenerateIds(std::size_t count) const {
  int64_t max = 0;
  for (const auto& slot : slots_) {
    if (auto number = IdNumber(slot.id); number && *number > max) {
      max = *number;
    }
  }

  std::vector<std::string> ids;
  ids.reserve(count);
  for (std::size_t i = 1; i <= count; ++i) {
    ids.push_back("ts" + std::to_string(max + static_cast<int64_t>(i)));
  }
  return ids;
}

TimeOrder TimeOrder::Filter(int64_t start_ms, int64_t end_ms) const {
  std::vector<TimeSlot> kept;
  for (const auto& slot : slots_) {
    if (slot.value && *slot.value >= start_ms && *slot.value <= end_ms) {
      kept.push_back(slot);
    }
  }
  return TimeOrder(std::move(kept));
}

void TimeOrder::Shift(int64_t shift_ms, bool allow_negative) {
  const auto bound = shift_ms > 0 ? MaxValue() : MinValue();
  if (bound && AddOverflows(*bound, shift_ms)) {
    throw util::InvalidArgument("shift of " + std::to_string(shift_ms) + " ms overflows time value " + std::to_string(*bound));
  }

  if (!allow_negative) {
    if (auto min = MinValue(); min && *min + shift_ms < 0) {
      throw util::ValueTooSmall(shift_ms);
    }
  }

  for (auto& slot : slots_) {
    if (slot.value) {
      *slot.value += shift_ms;
    }
  }
}

std::unordered_map<std::string, std::string> TimeOrder::Remap(std::size_t start) {
  std::unordered_map<std::string, std::string> renamed;
  renamed.reserve(slots_.size());

  for (std::size_t i = 0; i < slots_.size(); ++i) {
    std::string new_id = "ts" + std::to_string(start + i);
    renamed.emplace(slots_[i].id, new_id);
    slots_[i].id = std::move(new_id);
  }
  return renamed;
}

std::unordered_map<std::string, std::optional<int64_t>> TimeOrder::ValueById() const {
  std::unordered_map<std::string, std::optional<int64_t>> values;
  values.reserve(slots_.size());
  for (const auto& slot : slots_) {
    values.emplace(slot.id, slot.value);
  }
  return values;
}

std::unordered_map<int64_t, std::string> TimeOrder::IdByValue() const {
  // First slot wins when several share a value.
  std::unordered_map<int64_t, std::string> ids;
  for (const auto& slot : slots_) {
    if (slot.value) {
      ids.emplace(*slot.value, slot.id);
    }
  }
  return ids;
}

bool TimeOrder::HasDuplicateIds() const {
  std::unordered_set<std::string> seen;
  for (const auto& slot : slots_) {
    if (!seen.insert(slot.id).second) {
      return true;
    }
  }
  return false;
}

} // namespace eafkit::model
