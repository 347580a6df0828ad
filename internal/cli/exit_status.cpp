#include "exit_status.hpp"

#include "internal/util/errors.hpp"

namespace eafkit::cli {

ExitStatus ToExitStatus(const std::exception& e) {
  using namespace eafkit::util;

  if (dynamic_cast<const InputError*>(&e) || dynamic_cast<const CodecError*>(&e)) {
    return kExitInput;
  }
  if (dynamic_cast<const ReferenceError*>(&e)) {
    return kExitReference;
  }
  if (dynamic_cast<const StructureError*>(&e)) {
    return kExitStructure;
  }
  if (dynamic_cast<const IntegrityError*>(&e)) {
    return kExitIntegrity;
  }
  if (dynamic_cast<const ValueError*>(&e)) {
    return kExitValue;
  }

  return kExitInternal;
}

} // namespace eafkit::cli
