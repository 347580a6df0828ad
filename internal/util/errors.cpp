#include "errors.hpp"

namespace eafkit::util {

std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::NoData:
      return "no_data";
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::TypeMismatch:
      return "type_mismatch";
    case ErrorCode::AnnotationIdInvalid:
      return "annotation_id_invalid";
    case ErrorCode::AnnotationIdExists:
      return "annotation_id_exists";
    case ErrorCode::AnnotationMainMissing:
      return "annotation_main_missing";
    case ErrorCode::AnnotationRefCycle:
      return "annotation_ref_cycle";
    case ErrorCode::AnnotationRefTierMismatch:
      return "annotation_ref_tier_mismatch";
    case ErrorCode::AnnotationTypeMismatch:
      return "annotation_type_mismatch";
    case ErrorCode::AnnotationOverlap:
      return "annotation_overlap";
    case ErrorCode::AnnotationHasDependents:
      return "annotation_has_dependents";
    case ErrorCode::TierIdInvalid:
      return "tier_id_invalid";
    case ErrorCode::TierIdExists:
      return "tier_id_exists";
    case ErrorCode::TierTypeMismatch:
      return "tier_type_mismatch";
    case ErrorCode::TierAlignment:
      return "tier_alignment";
    case ErrorCode::TierRefMissingParent:
      return "tier_ref_missing_parent";
    case ErrorCode::TierCycle:
      return "tier_cycle";
    case ErrorCode::TierHasDependents:
      return "tier_has_dependents";
    case ErrorCode::TimeOrderMissing:
      return "time_order_missing";
    case ErrorCode::TimeslotIdInvalid:
      return "timeslot_id_invalid";
    case ErrorCode::TimeslotIdExists:
      return "timeslot_id_exists";
    case ErrorCode::TimeslotIdDuplicated:
      return "timeslot_id_duplicated";
    case ErrorCode::TimeslotRefMissing:
      return "timeslot_ref_missing";
    case ErrorCode::TimeslotValMissing:
      return "timeslot_val_missing";
    case ErrorCode::TimeSpanInvalid:
      return "time_span_invalid";
    case ErrorCode::ValueTooSmall:
      return "value_too_small";
    case ErrorCode::DecodeError:
      return "decode_error";
    case ErrorCode::IOError:
      return "io_error";
  }
  return "unknown";
}

InputError NoData() {
  return {ErrorCode::NoData, "Input is empty or contains no relevant data"};
}

InputError InvalidArgument(const std::string& what) {
  return {ErrorCode::InvalidArgument, "Invalid argument: " + what};
}

InputError Unsupported(const std::string& what) {
  return {ErrorCode::Unsupported, "Unsupported: " + what};
}

ReferenceError AnnotationIdInvalid(const std::string& annotation_id) {
  return {ErrorCode::AnnotationIdInvalid, "No such annotation '" + annotation_id + "'"};
}

ReferenceError AnnotationMainMissing(const std::string& annotation_id, const std::string& ref_id) {
  return {ErrorCode::AnnotationMainMissing,
          "Missing main annotation for ID '" + annotation_id + "'. No annotation with ID '" + (ref_id.empty() ? "NONE" : ref_id) + "'"};
}

ReferenceError TierIdInvalid(const std::string& tier_id) {
  return {ErrorCode::TierIdInvalid, "No such tier '" + tier_id + "'"};
}

ReferenceError TierRefMissingParent(const std::string& tier_id, const std::string& parent_id) {
  return {ErrorCode::TierRefMissingParent, "Referred tier '" + tier_id + "' has no parent tier '" + parent_id + "'"};
}

ReferenceError TimeslotIdInvalid(const std::string& time_slot_id) {
  return {ErrorCode::TimeslotIdInvalid, "No such time slot '" + time_slot_id + "'"};
}

ReferenceError TimeslotRefMissing(const std::string& annotation_id) {
  return {ErrorCode::TimeslotRefMissing, "No time slot reference for annotation with ID '" + annotation_id + "'"};
}

StructureError AnnotationTypeMismatch(const std::string& annotation_id, const std::string& tier_id) {
  return {ErrorCode::AnnotationTypeMismatch,
          "Annotation '" + annotation_id + "' is incompatible with the type of tier '" + tier_id + "'"};
}

StructureError AnnotationRefTierMismatch(const std::string& annotation_id, const std::string& ref_id, const std::string& parent_tier_id) {
  return {ErrorCode::AnnotationRefTierMismatch,
          "Annotation '" + annotation_id + "' refers to '" + ref_id + "', which is not in parent tier '" + parent_tier_id + "'"};
}

StructureError TierTypeMismatch(const std::string& tier_id1, const std::string& tier_id2) {
  return {ErrorCode::TierTypeMismatch, "The tiers '" + tier_id1 + "' and '" + tier_id2 + "' do not have compatible type"};
}

StructureError TimeOrderMissing() {
  return {ErrorCode::TimeOrderMissing, "Missing time order"};
}

IntegrityError AnnotationIdExists(const std::string& annotation_id) {
  return {ErrorCode::AnnotationIdExists, "Annotation with ID '" + annotation_id + "' already exists"};
}

IntegrityError AnnotationRefCycle(const std::string& annotation_id) {
  return {ErrorCode::AnnotationRefCycle, "Annotation reference chain for '" + annotation_id + "' is cyclic"};
}

IntegrityError AnnotationOverlap(const std::string& tier_id) {
  return {ErrorCode::AnnotationOverlap, "Annotation timespans overlap in tier '" + tier_id + "'"};
}

IntegrityError AnnotationHasDependents(const std::string& annotation_id, const std::string& dependent_id) {
  return {ErrorCode::AnnotationHasDependents, "Annotation '" + annotation_id + "' is still referred to by '" + dependent_id + "'"};
}

IntegrityError TierIdExists(const std::string& tier_id) {
  return {ErrorCode::TierIdExists, "Tier with ID '" + tier_id + "' already exists"};
}

IntegrityError TierAlignment(const std::string& parent_tier_id, const std::string& ref_tier_id) {
  return {ErrorCode::TierAlignment,
          "Annotations in referred tier '" + ref_tier_id + "' exceed those in parent tier '" + parent_tier_id + "'"};
}

IntegrityError TierCycle(const std::string& tier_id) {
  return {ErrorCode::TierCycle, "Tier '" + tier_id + "' is its own ancestor"};
}

IntegrityError TierHasDependents(const std::string& tier_id, const std::string& child_id) {
  return {ErrorCode::TierHasDependents, "Tier '" + tier_id + "' is parent of '" + child_id + "'"};
}

IntegrityError TimeslotIdExists(const std::string& time_slot_id) {
  return {ErrorCode::TimeslotIdExists, "Time slot with ID '" + time_slot_id + "' already exists"};
}

IntegrityError TimeslotIdDuplicated() {
  return {ErrorCode::TimeslotIdDuplicated, "Time slot ID must be unique"};
}

ValueError TimeslotValMissing(const std::string& annotation_id) {
  return {ErrorCode::TimeslotValMissing, "No time slot value for annotation with ID '" + annotation_id + "'"};
}

ValueError TimeSpanInvalid(std::int64_t start_ms, std::int64_t end_ms) {
  return {ErrorCode::TimeSpanInvalid, "Invalid time span " + std::to_string(start_ms) + "ms-" + std::to_string(end_ms) + "ms"};
}

ValueError ValueTooSmall(std::int64_t value) {
  return {ErrorCode::ValueTooSmall, "Value '" + std::to_string(value) + "' is too small in this context"};
}

CodecError DecodeError(const std::string& what) {
  return {ErrorCode::DecodeError, "Failed to decode document: " + what};
}

CodecError IOError(const std::string& what) {
  return {ErrorCode::IOError, "IO error: " + what};
}

} // namespace eafkit::util
