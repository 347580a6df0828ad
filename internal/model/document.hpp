#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/model/metadata.hpp"
#include "internal/model/tier.hpp"
#include "internal/model/time_order.hpp"

namespace eafkit::model {

/*
  Raw annotation document.

  Plain aggregate in the state it was constructed or decoded in. Derived
  annotation fields are only trustworthy once the document has gone
  through core::AnnotationDocument::Create.
*/
struct Document {
  std::string author;
  std::string date;     // ISO 8601
  std::string format  = "3.0";
  std::string version = "3.0";

  TimeOrder         time_order;
  std::vector<Tier> tiers;

  std::vector<LinguisticType>       linguistic_types;
  std::vector<Locale>               locales;
  std::vector<Language>             languages;
  std::vector<Constraint>           constraints;
  std::vector<ControlledVocabulary> controlled_vocabularies;

  Tier*       FindTier(const std::string& tier_id);
  const Tier* FindTier(const std::string& tier_id) const;

  bool HasLinguisticType(const std::string& id) const;

  std::size_t AnnotationCount() const;

  bool operator==(const Document& other) const;
  bool operator!=(const Document& other) const {
    return !(*this == other);
  }
};

/*
  Assembles a Document and checks the structural invariants that can be
  verified without derivation:

  - tiers without a time order: TimeOrderMissing
  - repeated time slot id:      TimeslotIdDuplicated
  - repeated tier id:           TierIdExists
  - annotation kind vs tier:    AnnotationTypeMismatch
  - tier ancestry loop:         TierCycle
  - optional main tier overlap: AnnotationOverlap

  Missing linguistic types and constraints are filled with defaults.
*/
class DocumentBuilder {
 public:
  DocumentBuilder& Author(std::string author);
  DocumentBuilder& Date(std::string date);
  DocumentBuilder& WithTimeOrder(TimeOrder time_order);
  DocumentBuilder& WithTiers(std::vector<Tier> tiers);
  DocumentBuilder& AddTier(Tier tier);
  DocumentBuilder& WithLinguisticTypes(std::vector<LinguisticType> linguistic_types);
  DocumentBuilder& WithLocales(std::vector<Locale> locales);
  DocumentBuilder& WithLanguages(std::vector<Language> languages);
  DocumentBuilder& WithConstraints(std::vector<Constraint> constraints);
  DocumentBuilder& WithControlledVocabularies(std::vector<ControlledVocabulary> controlled_vocabularies);
  DocumentBuilder& CheckOverlaps(bool check);

  Document Build() const;

 private:
  Document document_;
  bool     check_overlaps_ = false;
};

// Current UTC date-time, ISO 8601.
std::string Today();

} // namespace eafkit::model
