#pragma once

#include <exception>

namespace eafkit::cli {

/*
  Process exit codes of eafctl.
*/
enum ExitStatus : int {
  kExitOk        = 0,
  kExitUsage     = 1,
  kExitInput     = 2,
  kExitReference = 3,
  kExitStructure = 4,
  kExitIntegrity = 5,
  kExitValue     = 6,
  kExitInternal  = 10,
};

// Converts an exception into the exit code for its error kind.
ExitStatus ToExitStatus(const std::exception& e);

} // namespace eafkit::cli
