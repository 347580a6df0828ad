#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

#include "internal/index/reference_index.hpp"
#include "internal/model/document.hpp"

namespace eafkit::remap {

struct RemapResult {
  std::unordered_map<std::string, std::string> annotation_ids;  // old -> new
  std::unordered_map<std::string, std::string> timeslot_ids;    // old -> new
};

/*
  Renumbers annotations "a<annotation_start>".. in document order and
  time slots "ts<timeslot_start>".. in time order, then rewrites every
  reference through the rename maps. Remap(doc, index, 1, 1) yields
  a1..aN and ts1..tsM.

  Alignable slot refs must resolve (TimeslotIdInvalid otherwise, which
  means index is stale). Referred parent / previous ids that are not in
  the map are left as they are. Works on a copy; document is only
  replaced on success. Derived values must be rebuilt afterwards.
*/
RemapResult Remap(model::Document& document, const index::ReferenceIndex& index, std::size_t annotation_start = 1,
                  std::size_t timeslot_start = 1);

} // namespace eafkit::remap
