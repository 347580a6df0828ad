#include "internal/model/document.hpp"

#include <algorithm>
#include <ctime>

#include "internal/util/errors.hpp"
#include "internal/validate/validation.hpp"

namespace eafkit::model {

Tier* Document::FindTier(const std::string& tier_id) {
  auto it = std::find_if(tiers.begin(), tiers.end(), [&](const Tier& t) { return t.id == tier_id; });
  return it == tiers.end() ? nullptr : &*it;
}

const Tier* Document::FindTier(const std::string& tier_id) const {
  auto it = std::find_if(tiers.begin(), tiers.end(), [&](const Tier& t) { return t.id == tier_id; });
  return it == tiers.end() ? nullptr : &*it;
}

bool Document::HasLinguisticType(const std::string& id) const {
  return std::any_of(linguistic_types.begin(), linguistic_types.end(), [&](const LinguisticType& lt) { return lt.id == id; });
}

std::size_t Document::AnnotationCount() const {
  std::size_t count = 0;
  for (const auto& tier : tiers) {
    count += tier.annotations.size();
  }
  return count;
}

bool Document::operator==(const Document& other) const {
  return author == other.author && date == other.date && format == other.format && version == other.version &&
         time_order == other.time_order && tiers == other.tiers && linguistic_types == other.linguistic_types &&
         locales == other.locales && languages == other.languages && constraints == other.constraints &&
         controlled_vocabularies == other.controlled_vocabularies;
}

std::string Today() {
  std::time_t now = std::time(nullptr);
  std::tm     utc{};
  gmtime_r(&now, &utc);

  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S+00:00", &utc);
  return buffer;
}

// ------------------------------------------------------------
// Builder
// ------------------------------------------------------------

DocumentBuilder& DocumentBuilder::Author(std::string author) {
  document_.author = std::move(author);
  return *this;
}

DocumentBuilder& DocumentBuilder::Date(std::string date) {
  document_.date = std::move(date);
  return *this;
}

DocumentBuilder& DocumentBuilder::WithTimeOrder(TimeOrder time_order) {
  document_.time_order = std::move(time_order);
  return *this;
}

DocumentBuilder& DocumentBuilder::WithTiers(std::vector<Tier> tiers) {
  document_.tiers = std::move(tiers);
  return *this;
}

DocumentBuilder& DocumentBuilder::AddTier(Tier tier) {
  document_.tiers.push_back(std::move(tier));
  return *this;
}

DocumentBuilder& DocumentBuilder::WithLinguisticTypes(std::vector<LinguisticType> linguistic_types) {
  document_.linguistic_types = std::move(linguistic_types);
  return *this;
}

DocumentBuilder& DocumentBuilder::WithLocales(std::vector<Locale> locales) {
  document_.locales = std::move(locales);
  return *this;
}

DocumentBuilder& DocumentBuilder::WithLanguages(std::vector<Language> languages) {
  document_.languages = std::move(languages);
  return *this;
}

DocumentBuilder& DocumentBuilder::WithConstraints(std::vector<Constraint> constraints) {
  document_.constraints = std::move(constraints);
  return *this;
}

DocumentBuilder& DocumentBuilder::WithControlledVocabularies(std::vector<ControlledVocabulary> controlled_vocabularies) {
  document_.controlled_vocabularies = std::move(controlled_vocabularies);
  return *this;
}

DocumentBuilder& DocumentBuilder::CheckOverlaps(bool check) {
  check_overlaps_ = check;
  return *this;
}

Document DocumentBuilder::Build() const {
  Document document = document_;

  if (!document.tiers.empty() && document.time_order.Empty()) {
    throw util::TimeOrderMissing();
  }
  if (validate::TimeslotDuplicates(document.time_order)) {
    throw util::TimeslotIdDuplicated();
  }
  if (auto duplicate = validate::TierDuplicates(document.tiers)) {
    throw util::TierIdExists(*duplicate);
  }
  for (const auto& tier : document.tiers) {
    if (auto mismatch = validate::TierTypeMismatch(tier)) {
      throw util::AnnotationTypeMismatch(*mismatch, tier.id);
    }
  }
  if (auto cyclic = validate::TierHierarchyCycle(document.tiers)) {
    throw util::TierCycle(*cyclic);
  }

  if (check_overlaps_) {
    for (const auto& tier : document.tiers) {
      if (tier.IsMain() && validate::Overlap(validate::ResolveSpans(tier, document.time_order))) {
        throw util::AnnotationOverlap(tier.id);
      }
    }
  }

  if (document.date.empty()) {
    document.date = Today();
  }
  if (document.linguistic_types.empty()) {
    document.linguistic_types.push_back(LinguisticType::Default());
  }
  if (document.constraints.empty()) {
    document.constraints = Constraint::Defaults();
  }

  return document;
}

} // namespace eafkit::model
