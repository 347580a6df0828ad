#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace eafkit::model {

/*
  Text payload of an annotation.
*/
class AnnotationValue {
 public:
  AnnotationValue() = default;
  AnnotationValue(std::string text) : text_(std::move(text)) {
  }
  AnnotationValue(const char* text) : text_(text) {
  }

  const std::string& Str() const {
    return text_;
  }

  bool Empty() const {
    return text_.empty();
  }

  // Unicode scalar values, assuming UTF-8.
  std::size_t CharCount() const;

  // Whitespace separated tokens.
  std::vector<std::string> Tokens() const;

  bool operator==(const AnnotationValue& other) const {
    return text_ == other.text_;
  }
  bool operator!=(const AnnotationValue& other) const {
    return !(*this == other);
  }

 private:
  std::string text_;
};

// Refs of an annotation anchored directly to the time order.
struct AlignableRefs {
  std::string time_slot_ref1;
  std::string time_slot_ref2;

  bool operator==(const AlignableRefs& other) const {
    return time_slot_ref1 == other.time_slot_ref1 && time_slot_ref2 == other.time_slot_ref2;
  }
};

// Refs of an annotation anchored to a parent annotation.
struct ReferredRefs {
  std::string                annotation_ref;
  std::optional<std::string> previous;  // preceding sibling, tokenized tiers only

  bool operator==(const ReferredRefs& other) const {
    return annotation_ref == other.annotation_ref && previous == other.previous;
  }
};

/*
  One annotation, either alignable or referred.

  Persisted attributes live in the refs variant plus the common fields.
  tier id, start/end and main annotation id are derived values; they are
  filled in by the derivation engine and never serialized.
*/
class Annotation {
 public:
  using Refs = std::variant<AlignableRefs, ReferredRefs>;

  Annotation() = default;

  static Annotation Alignable(std::string id, AnnotationValue value, std::string time_slot_ref1, std::string time_slot_ref2);
  static Annotation Referred(std::string id, AnnotationValue value, std::string annotation_ref,
                             std::optional<std::string> previous = std::nullopt);

  bool IsAlignable() const {
    return std::holds_alternative<AlignableRefs>(refs_);
  }
  bool IsReferred() const {
    return std::holds_alternative<ReferredRefs>(refs_);
  }

  const std::string& Id() const {
    return id_;
  }
  void SetId(std::string id) {
    id_ = std::move(id);
  }

  const AnnotationValue& Value() const {
    return value_;
  }
  void SetValue(AnnotationValue value) {
    value_ = std::move(value);
  }

  const std::optional<std::string>& ExtRef() const {
    return ext_ref_;
  }
  const std::optional<std::string>& LangRef() const {
    return lang_ref_;
  }
  const std::optional<std::string>& CveRef() const {
    return cve_ref_;
  }
  void SetExtRef(std::optional<std::string> ref) {
    ext_ref_ = std::move(ref);
  }
  void SetLangRef(std::optional<std::string> ref) {
    lang_ref_ = std::move(ref);
  }
  void SetCveRef(std::optional<std::string> ref) {
    cve_ref_ = std::move(ref);
  }

  const Refs& GetRefs() const {
    return refs_;
  }

  // Alignable only.
  std::optional<std::pair<std::string, std::string>> TimeSlotRefs() const;
  void                                               SetTimeSlotRefs(std::string time_slot_ref1, std::string time_slot_ref2);

  // Referred only.
  std::optional<std::string> RefId() const;
  std::optional<std::string> Previous() const;
  void                       SetRefId(std::string annotation_ref);
  void                       SetPrevious(std::optional<std::string> previous);

  // Derived values.
  const std::optional<std::string>& TierId() const {
    return tier_id_;
  }
  const std::optional<int64_t>& Start() const {
    return start_ms_;
  }
  const std::optional<int64_t>& End() const {
    return end_ms_;
  }
  // Id of the alignable annotation at the end of the reference chain.
  const std::optional<std::string>& MainId() const {
    return main_id_;
  }

  void SetTierId(std::optional<std::string> tier_id) {
    tier_id_ = std::move(tier_id);
  }
  void SetTimes(std::optional<int64_t> start_ms, std::optional<int64_t> end_ms) {
    start_ms_ = start_ms;
    end_ms_   = end_ms;
  }
  void SetMainId(std::optional<std::string> main_id) {
    main_id_ = std::move(main_id);
  }
  void ClearDerived();

  // Copies keeping id, value and attribute refs, with new anchoring.
  Annotation ToAlignable(std::string time_slot_ref1, std::string time_slot_ref2) const;
  Annotation ToReferred(std::string annotation_ref, std::optional<std::string> previous) const;

  // Same value and kind; optionally same derived time span.
  bool IsIdentical(const Annotation& other, bool compare_time) const;

  // Persisted fields only.
  bool operator==(const Annotation& other) const;
  bool operator!=(const Annotation& other) const {
    return !(*this == other);
  }

 private:
  std::string                id_;
  std::optional<std::string> ext_ref_;
  std::optional<std::string> lang_ref_;
  std::optional<std::string> cve_ref_;
  AnnotationValue            value_;
  Refs                       refs_;

  std::optional<std::string> tier_id_;
  std::optional<int64_t>     start_ms_;
  std::optional<int64_t>     end_ms_;
  std::optional<std::string> main_id_;
};

} // namespace eafkit::model
