#include <cassert>
#include <iostream>

#include "internal/core/annotation_document.hpp"
#include "internal/index/reference_index.hpp"
#include "internal/util/errors.hpp"
#include "internal/validate/validation.hpp"
#include "tests/unit/test_documents.hpp"

namespace {

using eafkit::model::Annotation;
using eafkit::model::Document;
using eafkit::model::Tier;
using eafkit::util::ErrorCode;
using eafkit::validate::Span;

template <typename Fn>
ErrorCode ThrownCode(Fn&& fn) {
  try {
    fn();
  } catch (const eafkit::util::EafError& e) {
    return e.code();
  }
  assert(false && "expected an EafError");
  return ErrorCode::NoData;
}

void Check(const Document& document) {
  eafkit::validate::CheckStructure(document, eafkit::index::Build(document));
}

void TestOverlapSortsByStart() {
  assert(!eafkit::validate::Overlap(std::vector<Span>{}));
  assert(!eafkit::validate::Overlap({Span{"a2", 100, 200}, Span{"a1", 0, 100}}));
  assert(eafkit::validate::Overlap({Span{"a2", 100, 200}, Span{"a1", 0, 101}}));
  assert(eafkit::validate::Overlap({Span{"a1", 0, 1000}, Span{"a2", 10, 20}, Span{"a3", 2000, 3000}}));
}

void TestOverlapNeedsResolvedSpans() {
  assert(ThrownCode([] { eafkit::validate::Overlap({Span{"a1", 0, std::nullopt}}); }) == ErrorCode::TimeslotValMissing);
}

void TestResolveSpansThroughTimeOrder() {
  const auto  document = eafkit::testing::WordsDocument();
  const auto  spans    = eafkit::validate::ResolveSpans(document.tiers[0], document.time_order);
  assert(spans.size() == 2);
  assert(*spans[1].start_ms == 500);
  assert(*spans[1].end_ms == 1000);

  auto broken = document.tiers[0];
  broken.annotations[0].SetTimeSlotRefs("ts1", "ts42");
  assert(ThrownCode([&] { eafkit::validate::ResolveSpans(broken, document.time_order); }) == ErrorCode::TimeslotRefMissing);
}

void TestTierLevelChecks() {
  Tier tier;
  tier.id = "t";
  tier.Add(Annotation::Alignable("a1", "x", "ts1", "ts2"));
  assert(eafkit::validate::TierTypeMatches(tier));

  tier.Add(Annotation::Referred("a2", "y", "a1"));
  assert(*eafkit::validate::TierTypeMismatch(tier) == "a2");

  Tier copy = tier;
  assert(*eafkit::validate::TierDuplicates({tier, copy}) == "t");

  Tier a;
  a.id         = "a";
  a.parent_ref = "b";
  Tier b;
  b.id         = "b";
  b.parent_ref = "a";
  assert(eafkit::validate::TierHierarchyCycle({a, b}).has_value());
  b.parent_ref.reset();
  assert(!eafkit::validate::TierHierarchyCycle({a, b}).has_value());
}

void TestDanglingTimeslotRefs() {
  auto document = eafkit::testing::WordsDocument();
  assert(eafkit::validate::DanglingTimeslotRefs(document).empty());
  document.time_order.Remove("ts4");
  const auto dangling = eafkit::validate::DanglingTimeslotRefs(document);
  assert(dangling.size() == 1);
  assert(dangling[0] == "a2");
}

void TestCheckStructureAcceptsWellFormed() {
  Check(eafkit::testing::WordsDocument());
}

void TestCheckStructureReportsInOrder() {
  auto duplicate_annotation = eafkit::testing::WordsDocument();
  duplicate_annotation.tiers[1].annotations[0].SetId("a2");
  assert(ThrownCode([&] { Check(duplicate_annotation); }) == ErrorCode::AnnotationIdExists);

  auto missing_parent = eafkit::testing::WordsDocument();
  missing_parent.tiers[1].parent_ref = "nope";
  assert(ThrownCode([&] { Check(missing_parent); }) == ErrorCode::TierRefMissingParent);

  auto kind_mismatch = eafkit::testing::WordsDocument();
  kind_mismatch.tiers[0].Add(Annotation::Referred("a3", "x", "a1"));
  assert(ThrownCode([&] { Check(kind_mismatch); }) == ErrorCode::AnnotationTypeMismatch);

  auto duplicate_slot = eafkit::testing::WordsDocument();
  duplicate_slot.time_order = eafkit::model::TimeOrder({{"ts1", 0}, {"ts1", 5}, {"ts3", 500}, {"ts4", 1000}});
  assert(ThrownCode([&] { Check(duplicate_slot); }) == ErrorCode::TimeslotIdDuplicated);
}

void TestRefOutsideParentTier() {
  auto document = eafkit::testing::WordsDocument();

  Tier other;
  other.id = "other";
  other.Add(Annotation::Alignable("o1", "x", "ts1", "ts2"));
  document.tiers.push_back(other);
  document.tiers[1].annotations[0].SetRefId("o1");

  assert(ThrownCode([&] { Check(document); }) == ErrorCode::AnnotationRefTierMismatch);
}

void TestOverlappingTiersOnlyLooksAtMainTiers() {
  auto        document = eafkit::testing::SingleTierDocument("speaker", {{0, 100}, {50, 150}});
  auto&       speaker  = document.tiers[0];
  const auto  spans    = eafkit::validate::ResolveSpans(speaker, document.time_order);
  for (std::size_t i = 0; i < spans.size(); ++i) {
    speaker.annotations[i].SetTimes(spans[i].start_ms, spans[i].end_ms);
  }

  // Tokens share the span of their parent.
  Tier tokens;
  tokens.id         = "tokens";
  tokens.parent_ref = "speaker";
  tokens.Add(Annotation::Referred("t1", "x", "a1"));
  tokens.Add(Annotation::Referred("t2", "y", "a1", std::string("t1")));
  for (auto& annotation : tokens.annotations) {
    annotation.SetTimes(0, 100);
  }
  document.tiers.push_back(tokens);

  const auto overlapping = eafkit::validate::OverlappingTiers(document);
  assert(overlapping.size() == 1);
  assert(overlapping[0] == "speaker");
}

// ts2 carries no value, so a1 and a2 only resolve one end each.
Document UnalignedDocument() {
  Tier speaker;
  speaker.id = "speaker";
  speaker.Add(Annotation::Alignable("a1", "one", "ts1", "ts2"));
  speaker.Add(Annotation::Alignable("a2", "two", "ts2", "ts3"));
  speaker.Add(Annotation::Alignable("a3", "three", "ts4", "ts5"));
  speaker.Add(Annotation::Alignable("a4", "four", "ts6", "ts7"));

  return eafkit::model::DocumentBuilder()
      .Date("2024-01-01T00:00:00+00:00")
      .WithTimeOrder(eafkit::model::TimeOrder(
          {{"ts1", 0}, {"ts2", std::nullopt}, {"ts3", 1000}, {"ts4", 1000}, {"ts5", 1500}, {"ts6", 2000}, {"ts7", 2500}}))
      .AddTier(std::move(speaker))
      .Build();
}

void TestOverlappingTiersSkipsUnalignedSlots() {
  auto document = eafkit::core::AnnotationDocument::Create(UnalignedDocument());
  assert(!document.GetAnnotation("a1")->End().has_value());
  assert(eafkit::validate::OverlappingTiers(document.Raw()).empty());

  // Resolved spans on the same tier are still compared.
  Document overlapping = UnalignedDocument();
  overlapping.time_order = eafkit::model::TimeOrder(
      {{"ts1", 0}, {"ts2", std::nullopt}, {"ts3", 1000}, {"ts4", 1000}, {"ts5", 2200}, {"ts6", 2000}, {"ts7", 2500}});
  auto derived = eafkit::core::AnnotationDocument::Create(std::move(overlapping));
  const auto tiers = eafkit::validate::OverlappingTiers(derived.Raw());
  assert(tiers.size() == 1);
  assert(tiers[0] == "speaker");
}

} // namespace

int main() {
  TestOverlapSortsByStart();
  TestOverlapNeedsResolvedSpans();
  TestResolveSpansThroughTimeOrder();
  TestTierLevelChecks();
  TestDanglingTimeslotRefs();
  TestCheckStructureAcceptsWellFormed();
  TestCheckStructureReportsInOrder();
  TestRefOutsideParentTier();
  TestOverlappingTiersOnlyLooksAtMainTiers();
  TestOverlappingTiersSkipsUnalignedSlots();

  std::cout << "eafkit_unit_validation: pass\n";
  return 0;
}
