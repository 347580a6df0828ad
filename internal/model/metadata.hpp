#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eafkit::model {

enum class StereoType {
  IncludedIn,
  SymbolicAssociation,
  SymbolicSubdivision,
  TimeSubdivision,
};

// EAF names: "Included_In", "Symbolic_Association", ...
std::string_view ToString(StereoType stereotype);
StereoType       StereoTypeFromString(std::string_view name);  // InvalidArgument on unknown name

bool TimeAlignable(StereoType stereotype);

struct Constraint {
  std::string description;
  StereoType  stereotype = StereoType::IncludedIn;

  static Constraint              FromStereoType(StereoType stereotype);
  // Time_Subdivision, Symbolic_Subdivision, Included_In
  static std::vector<Constraint> Defaults();

  bool operator==(const Constraint& other) const {
    return description == other.description && stereotype == other.stereotype;
  }
};

struct LinguisticType {
  std::string               id;
  std::optional<bool>       time_alignable;
  std::optional<StereoType> constraint;
  std::optional<bool>       graphic_references;
  std::optional<std::string> controlled_vocabulary;
  std::optional<std::string> ext_ref;
  std::optional<std::string> lexicon_ref;

  // Time alignable unless a symbolic stereotype is given.
  static LinguisticType Create(const std::string& id, std::optional<StereoType> stereotype = std::nullopt);
  static LinguisticType Default();

  bool operator==(const LinguisticType& other) const;
};

struct Locale {
  std::string                language_code;
  std::optional<std::string> country_code;
  std::optional<std::string> variant;

  bool operator==(const Locale& other) const {
    return language_code == other.language_code && country_code == other.country_code && variant == other.variant;
  }
};

struct Language {
  std::string                id;
  std::optional<std::string> definition;
  std::optional<std::string> label;

  bool operator==(const Language& other) const {
    return id == other.id && definition == other.definition && label == other.label;
  }
};

struct CvEntry {
  std::string                id;
  std::string                value;
  std::optional<std::string> description;
  std::optional<std::string> ext_ref;
  std::optional<std::string> language_ref;

  bool operator==(const CvEntry& other) const {
    return id == other.id && value == other.value && description == other.description && ext_ref == other.ext_ref &&
           language_ref == other.language_ref;
  }
};

struct ControlledVocabulary {
  std::string                id;
  std::optional<std::string> description;
  std::optional<std::string> ext_ref;
  std::vector<CvEntry>       entries;

  bool operator==(const ControlledVocabulary& other) const {
    return id == other.id && description == other.description && ext_ref == other.ext_ref && entries == other.entries;
  }
};

} // namespace eafkit::model
