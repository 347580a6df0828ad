#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace eafkit::model {

/*
  A named point on the document time line.

  Value is in milliseconds. Slots without a value are legal
  (unaligned boundaries).
*/
struct TimeSlot {
  std::string            id;
  std::optional<int64_t> value;

  bool operator==(const TimeSlot& other) const {
    return id == other.id && value == other.value;
  }
};

/*
  Ordered list of time slots. Slot ids are unique within a document.
*/
class TimeOrder {
 public:
  TimeOrder() = default;
  explicit TimeOrder(std::vector<TimeSlot> slots);

  // Builds "ts<start>".. slots, one per value, in the given order.
  static TimeOrder FromValues(const std::vector<int64_t>& values, std::size_t start = 1);

  const std::vector<TimeSlot>& Slots() const {
    return slots_;
  }

  std::size_t Size() const {
    return slots_.size();
  }

  bool Empty() const {
    return slots_.empty();
  }

  bool            Contains(const std::string& id) const;
  const TimeSlot* Find(const std::string& id) const;

  // Appends a slot, generating an id when none is given. Returns the slot id.
  std::string Add(const std::optional<std::string>& id, std::optional<int64_t> value);
  void        Join(const TimeOrder& other);
  bool        Remove(const std::string& id);

  std::optional<int64_t> MinValue() const;
  std::optional<int64_t> MaxValue() const;

  std::string              GenerateId() const;
  std::vector<std::string> GenerateIds(std::size_t count) const;

  // Slots whose value lies in [start_ms, end_ms]. Valueless slots are dropped.
  TimeOrder Filter(int64_t start_ms, int64_t end_ms) const;

  // InvalidArgument when a value would leave the int64 range, ValueTooSmall
  // when one would turn negative and allow_negative is false.
  void Shift(int64_t shift_ms, bool allow_negative);

  // Renames slots "ts<start>".. in order. Returns old id -> new id.
  std::unordered_map<std::string, std::string> Remap(std::size_t start);

  std::unordered_map<std::string, std::optional<int64_t>> ValueById() const;
  std::unordered_map<int64_t, std::string>                IdByValue() const;

  bool HasDuplicateIds() const;

  bool operator==(const TimeOrder& other) const {
    return slots_ == other.slots_;
  }

 private:
  std::vector<TimeSlot> slots_;
};

// Numeric component of an id such as "ts12" or "a7".
std::optional<int64_t> IdNumber(const std::string& id);

} // namespace eafkit::model
