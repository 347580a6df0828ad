#include "internal/cli/exit_status.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace eafkit::util;
using eafkit::cli::ToExitStatus;

void TestEachFamilyHasItsOwnStatus() {
  assert(ToExitStatus(NoData()) == eafkit::cli::kExitInput);
  assert(ToExitStatus(Unsupported("x")) == eafkit::cli::kExitInput);
  assert(ToExitStatus(DecodeError("x")) == eafkit::cli::kExitInput);
  assert(ToExitStatus(IOError("x")) == eafkit::cli::kExitInput);
  assert(ToExitStatus(TierIdInvalid("t")) == eafkit::cli::kExitReference);
  assert(ToExitStatus(TimeslotRefMissing("a1")) == eafkit::cli::kExitReference);
  assert(ToExitStatus(AnnotationTypeMismatch("a1", "t")) == eafkit::cli::kExitStructure);
  assert(ToExitStatus(TimeOrderMissing()) == eafkit::cli::kExitStructure);
  assert(ToExitStatus(AnnotationOverlap("t")) == eafkit::cli::kExitIntegrity);
  assert(ToExitStatus(AnnotationRefCycle("a1")) == eafkit::cli::kExitIntegrity);
  assert(ToExitStatus(ValueTooSmall(-5)) == eafkit::cli::kExitValue);
  assert(ToExitStatus(TimeSpanInvalid(10, 5)) == eafkit::cli::kExitValue);
  assert(ToExitStatus(std::runtime_error("boom")) == eafkit::cli::kExitInternal);
}

void TestErrorsCarryCodeAndContext() {
  const auto error = AnnotationMainMissing("r1", "a9");
  assert(error.code() == ErrorCode::AnnotationMainMissing);
  assert(std::string(error.what()).find("a9") != std::string::npos);
  assert(ToString(ErrorCode::TimeslotValMissing) == "timeslot_val_missing");
  assert(ToString(ErrorCode::AnnotationRefTierMismatch) == "annotation_ref_tier_mismatch");
}

void TestUuidStringForm() {
  const auto text = GenerateUUIDString();
  assert(text.size() == 36);
  assert(text[14] == '4');
  assert(text[8] == '-' && text[13] == '-' && text[18] == '-' && text[23] == '-');
  assert(GenerateUUIDString() != text);

  const eafkit::util::UUID zero{};
  assert(ToString(zero) == "00000000-0000-0000-0000-000000000000");
}

} // namespace

int main() {
  TestEachFamilyHasItsOwnStatus();
  TestErrorsCarryCodeAndContext();
  TestUuidStringForm();

  std::cout << "eafkit_unit_exit_status: pass\n";
  return 0;
}
