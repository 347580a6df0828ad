#pragma once

#include "internal/index/reference_index.hpp"
#include "internal/model/document.hpp"

namespace eafkit::derive {

/*
  Fills the derived fields of every annotation: tier id, start/end and,
  for referred annotations, the id of the main (alignable) annotation at
  the end of the reference chain.

  Resolution runs read-only into a side table first; the document is
  written only when every annotation resolved. Errors:

  - TimeslotRefMissing:    alignable ref to a slot not in the time order
  - AnnotationMainMissing: parent id that resolves to nothing
  - AnnotationRefCycle:    reference chain that revisits an annotation

  index must have been built from document. Idempotent.
*/
void Derive(model::Document& document, const index::ReferenceIndex& index);

} // namespace eafkit::derive
