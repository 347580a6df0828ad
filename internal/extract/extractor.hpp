#pragma once

#include <cstdint>

#include "internal/core/annotation_document.hpp"

namespace eafkit::extract {

/*
  Time window subset of a document.

  Keeps the time slots valued within [start_ms, end_ms] and every
  annotation whose main annotation is anchored on two kept slots.
  Annotations only partly inside the window are dropped, not truncated.
  The result is renumbered from a1 / ts1 and shifted so the window
  starts at 0. An empty result is valid.

  TimeSpanInvalid when end_ms < start_ms.
*/
core::AnnotationDocument Extract(const core::AnnotationDocument& source, int64_t start_ms, int64_t end_ms);

} // namespace eafkit::extract
