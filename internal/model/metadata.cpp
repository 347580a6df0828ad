#include "internal/model/metadata.hpp"

#include "internal/util/errors.hpp"

namespace eafkit::model {

std::string_view ToString(StereoType stereotype) {
  switch (stereotype) {
    case StereoType::IncludedIn:
      return "Included_In";
    case StereoType::SymbolicAssociation:
      return "Symbolic_Association";
    case StereoType::SymbolicSubdivision:
      return "Symbolic_Subdivision";
    case StereoType::TimeSubdivision:
      return "Time_Subdivision";
  }
  return "Included_In";
}

StereoType StereoTypeFromString(std::string_view name) {
  if (name == "Included_In")
    return StereoType::IncludedIn;
  if (name == "Symbolic_Association")
    return StereoType::SymbolicAssociation;
  if (name == "Symbolic_Subdivision")
    return StereoType::SymbolicSubdivision;
  if (name == "Time_Subdivision")
    return StereoType::TimeSubdivision;
  throw util::InvalidArgument("no such stereotype '" + std::string(name) + "'");
}

bool TimeAlignable(StereoType stereotype) {
  return stereotype == StereoType::IncludedIn || stereotype == StereoType::TimeSubdivision;
}

Constraint Constraint::FromStereoType(StereoType stereotype) {
  switch (stereotype) {
    case StereoType::IncludedIn:
      return {"Time alignable annotations within the parent annotation's time interval, gaps are allowed", stereotype};
    case StereoType::SymbolicSubdivision:
      return {"Symbolic subdivision of a parent annotation. Annotations refering to the same parent are ordered", stereotype};
    case StereoType::SymbolicAssociation:
      return {"1-1 association with a parent annotation", stereotype};
    case StereoType::TimeSubdivision:
      return {"Time subdivision of parent annotation's time interval, no time gaps allowed within this interval", stereotype};
  }
  return {"", stereotype};
}

std::vector<Constraint> Constraint::Defaults() {
  return {
      FromStereoType(StereoType::TimeSubdivision),
      FromStereoType(StereoType::SymbolicSubdivision),
      FromStereoType(StereoType::IncludedIn),
  };
}

LinguisticType LinguisticType::Create(const std::string& id, std::optional<StereoType> stereotype) {
  LinguisticType lt;
  lt.id             = id;
  lt.time_alignable = stereotype ? TimeAlignable(*stereotype) : true;
  lt.constraint     = stereotype;
  return lt;
}

LinguisticType LinguisticType::Default() {
  return Create("default-lt");
}

bool LinguisticType::operator==(const LinguisticType& other) const {
  return id == other.id && time_alignable == other.time_alignable && constraint == other.constraint &&
         graphic_references == other.graphic_references && controlled_vocabulary == other.controlled_vocabulary &&
         ext_ref == other.ext_ref && lexicon_ref == other.lexicon_ref;
}

} // namespace eafkit::model
