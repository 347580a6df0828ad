#include "internal/model/annotation.hpp"

#include <sstream>

#include "internal/util/errors.hpp"

namespace eafkit::model {

std::size_t AnnotationValue::CharCount() const {
  std::size_t count = 0;
  for (unsigned char c : text_) {
    // count every byte that does not continue a multi byte sequence
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

std::vector<std::string> AnnotationValue::Tokens() const {
  std::vector<std::string> tokens;
  std::istringstream       in(text_);
  std::string              token;
  while (in >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

Annotation Annotation::Alignable(std::string id, AnnotationValue value, std::string time_slot_ref1, std::string time_slot_ref2) {
  Annotation annotation;
  annotation.id_    = std::move(id);
  annotation.value_ = std::move(value);
  annotation.refs_  = AlignableRefs{std::move(time_slot_ref1), std::move(time_slot_ref2)};
  return annotation;
}

Annotation Annotation::Referred(std::string id, AnnotationValue value, std::string annotation_ref, std::optional<std::string> previous) {
  Annotation annotation;
  annotation.id_    = std::move(id);
  annotation.value_ = std::move(value);
  annotation.refs_  = ReferredRefs{std::move(annotation_ref), std::move(previous)};
  return annotation;
}

// ------------------------------------------------------------
// Variant accessors
// ------------------------------------------------------------

std::optional<std::pair<std::string, std::string>> Annotation::TimeSlotRefs() const {
  if (const auto* refs = std::get_if<AlignableRefs>(&refs_)) {
    return std::make_pair(refs->time_slot_ref1, refs->time_slot_ref2);
  }
  return std::nullopt;
}

void Annotation::SetTimeSlotRefs(std::string time_slot_ref1, std::string time_slot_ref2) {
  auto* refs = std::get_if<AlignableRefs>(&refs_);
  if (!refs) {
    throw util::AnnotationTypeMismatch(id_, tier_id_.value_or(""));
  }
  refs->time_slot_ref1 = std::move(time_slot_ref1);
  refs->time_slot_ref2 = std::move(time_slot_ref2);
}

std::optional<std::string> Annotation::RefId() const {
  if (const auto* refs = std::get_if<ReferredRefs>(&refs_)) {
    return refs->annotation_ref;
  }
  return std::nullopt;
}

std::optional<std::string> Annotation::Previous() const {
  if (const auto* refs = std::get_if<ReferredRefs>(&refs_)) {
    return refs->previous;
  }
  return std::nullopt;
}

void Annotation::SetRefId(std::string annotation_ref) {
  auto* refs = std::get_if<ReferredRefs>(&refs_);
  if (!refs) {
    throw util::AnnotationTypeMismatch(id_, tier_id_.value_or(""));
  }
  refs->annotation_ref = std::move(annotation_ref);
}

void Annotation::SetPrevious(std::optional<std::string> previous) {
  auto* refs = std::get_if<ReferredRefs>(&refs_);
  if (!refs) {
    throw util::AnnotationTypeMismatch(id_, tier_id_.value_or(""));
  }
  refs->previous = std::move(previous);
}

void Annotation::ClearDerived() {
  tier_id_.reset();
  start_ms_.reset();
  end_ms_.reset();
  main_id_.reset();
}

Annotation Annotation::ToAlignable(std::string time_slot_ref1, std::string time_slot_ref2) const {
  Annotation converted = *this;
  converted.refs_      = AlignableRefs{std::move(time_slot_ref1), std::move(time_slot_ref2)};
  converted.main_id_.reset();
  return converted;
}

Annotation Annotation::ToReferred(std::string annotation_ref, std::optional<std::string> previous) const {
  Annotation converted = *this;
  converted.refs_      = ReferredRefs{std::move(annotation_ref), std::move(previous)};
  return converted;
}

bool Annotation::IsIdentical(const Annotation& other, bool compare_time) const {
  if (value_ != other.value_ || IsAlignable() != other.IsAlignable()) {
    return false;
  }
  if (compare_time) {
    return start_ms_ == other.start_ms_ && end_ms_ == other.end_ms_;
  }
  return true;
}

bool Annotation::operator==(const Annotation& other) const {
  return id_ == other.id_ && ext_ref_ == other.ext_ref_ && lang_ref_ == other.lang_ref_ && cve_ref_ == other.cve_ref_ &&
         value_ == other.value_ && refs_ == other.refs_;
}

} // namespace eafkit::model
