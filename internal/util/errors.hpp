#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace eafkit::util {

/*
  Central error types.

  Every failure carries an ErrorCode. The exception class names the kind
  of failure, which is what callers (and the CLI exit status mapping) switch on:

  - ReferenceError: an id that should resolve does not
  - StructureError: annotation/tier kinds do not fit together
  - IntegrityError: duplicates, overlaps, cycles, misaligned tiers
  - ValueError:     a time value outside the allowed domain
  - InputError:     empty input, bad arguments, unsupported options
  - CodecError:     snapshot decode / file I/O
*/

enum class ErrorCode {
  NoData = 1,
  InvalidArgument,
  Unsupported,
  TypeMismatch,

  AnnotationIdInvalid,
  AnnotationIdExists,
  AnnotationMainMissing,
  AnnotationRefCycle,
  AnnotationRefTierMismatch,
  AnnotationTypeMismatch,
  AnnotationOverlap,
  AnnotationHasDependents,

  TierIdInvalid,
  TierIdExists,
  TierTypeMismatch,
  TierAlignment,
  TierRefMissingParent,
  TierCycle,
  TierHasDependents,

  TimeOrderMissing,
  TimeslotIdInvalid,
  TimeslotIdExists,
  TimeslotIdDuplicated,
  TimeslotRefMissing,
  TimeslotValMissing,
  TimeSpanInvalid,

  ValueTooSmall,

  DecodeError,
  IOError,
};

std::string_view ToString(ErrorCode code);

class EafError : public std::runtime_error {
 public:
  EafError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const noexcept {
    return code_;
  }

 private:
  ErrorCode code_;
};

class ReferenceError : public EafError {
 public:
  ReferenceError(ErrorCode code, const std::string& msg) : EafError(code, msg) {
  }
};

class StructureError : public EafError {
 public:
  StructureError(ErrorCode code, const std::string& msg) : EafError(code, msg) {
  }
};

class IntegrityError : public EafError {
 public:
  IntegrityError(ErrorCode code, const std::string& msg) : EafError(code, msg) {
  }
};

class ValueError : public EafError {
 public:
  ValueError(ErrorCode code, const std::string& msg) : EafError(code, msg) {
  }
};

class InputError : public EafError {
 public:
  InputError(ErrorCode code, const std::string& msg) : EafError(code, msg) {
  }
};

class CodecError : public EafError {
 public:
  CodecError(ErrorCode code, const std::string& msg) : EafError(code, msg) {
  }
};

// ------------------------------------------------------------
// Factories. Keep messages in one place.
// ------------------------------------------------------------

InputError NoData();
InputError InvalidArgument(const std::string& what);
InputError Unsupported(const std::string& what);

ReferenceError AnnotationIdInvalid(const std::string& annotation_id);
ReferenceError AnnotationMainMissing(const std::string& annotation_id, const std::string& ref_id);
ReferenceError TierIdInvalid(const std::string& tier_id);
ReferenceError TierRefMissingParent(const std::string& tier_id, const std::string& parent_id);
ReferenceError TimeslotIdInvalid(const std::string& time_slot_id);
ReferenceError TimeslotRefMissing(const std::string& annotation_id);

StructureError AnnotationTypeMismatch(const std::string& annotation_id, const std::string& tier_id);
StructureError AnnotationRefTierMismatch(const std::string& annotation_id, const std::string& ref_id, const std::string& parent_tier_id);
StructureError TierTypeMismatch(const std::string& tier_id1, const std::string& tier_id2);
StructureError TimeOrderMissing();

IntegrityError AnnotationIdExists(const std::string& annotation_id);
IntegrityError AnnotationRefCycle(const std::string& annotation_id);
IntegrityError AnnotationOverlap(const std::string& tier_id);
IntegrityError AnnotationHasDependents(const std::string& annotation_id, const std::string& dependent_id);
IntegrityError TierIdExists(const std::string& tier_id);
IntegrityError TierAlignment(const std::string& parent_tier_id, const std::string& ref_tier_id);
IntegrityError TierCycle(const std::string& tier_id);
IntegrityError TierHasDependents(const std::string& tier_id, const std::string& child_id);
IntegrityError TimeslotIdExists(const std::string& time_slot_id);
IntegrityError TimeslotIdDuplicated();

ValueError TimeslotValMissing(const std::string& annotation_id);
ValueError TimeSpanInvalid(std::int64_t start_ms, std::int64_t end_ms);
ValueError ValueTooSmall(std::int64_t value);

CodecError DecodeError(const std::string& what);
CodecError IOError(const std::string& what);

} // namespace eafkit::util
