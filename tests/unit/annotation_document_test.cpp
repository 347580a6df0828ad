#include <cassert>
#include <iostream>

#include "internal/core/annotation_document.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_documents.hpp"

namespace {

using eafkit::core::AnnotationDocument;
using eafkit::model::Annotation;
using eafkit::model::Tier;
using eafkit::util::ErrorCode;

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

AnnotationDocument Words() {
  return AnnotationDocument::Create(eafkit::testing::WordsDocument());
}

void TestCreateDerivesEverything() {
  const auto document = Words();
  const auto* r1      = document.GetAnnotation("r1");
  assert(r1 != nullptr);
  assert(*r1->End() == 500);
  assert(document.MainAnnotation("r1")->Id() == "a1");
  assert(document.MainAnnotation("a2")->Id() == "a2");
  assert(document.GetAnnotation("zz") == nullptr);
  assert(document.MainAnnotation("zz") == nullptr);
}

void TestCreateRejectsBrokenStructure() {
  auto raw = eafkit::testing::WordsDocument();
  raw.tiers[1].parent_ref = "missing";
  assert(ThrownCode([&] { AnnotationDocument::Create(raw); }) == ErrorCode::TierRefMissingParent);
}

void TestTierQueries() {
  const auto document = Words();

  assert(document.MainTier("translit")->id == "words");
  assert(document.MainTier("words")->id == "words");
  assert(document.ParentTier("translit")->id == "words");
  assert(document.ParentTier("words") == nullptr);
  assert(ThrownCode([&] { document.MainTier("zz"); }) == ErrorCode::TierIdInvalid);
  assert(ThrownCode([&] { document.ChildTiers("zz"); }) == ErrorCode::TierIdInvalid);

  const auto children = document.ChildTiers("words");
  assert(children.size() == 1);
  assert(children[0]->id == "translit");

  assert(document.TierIds().size() == 2);
  assert(document.MainTierIds().front() == "words");
  assert(document.RefTierIds().front() == "translit");
  assert(document.TierCount() == 2);
  assert(document.AnnotationCount() == 3);
}

void TestExistsLooksInEveryNamespace() {
  const auto document = Words();
  assert(document.Exists("words").tier);
  assert(document.Exists("r1").annotation);
  assert(document.Exists("ts2").timeslot);
  assert(!document.Exists("nothing").Any());
}

void TestTimeQueries() {
  const auto document = Words();
  assert(*document.TimeslotValue("ts4") == 1000);
  assert(!document.TimeslotValue("ts9").has_value());
  assert(*document.TimeslotId(500) == "ts2");
  assert(!document.TimeslotId(7).has_value());
  assert(*document.MinTimeValue() == 0);
  assert(*document.MaxTimeValue() == 1000);
  assert(document.FirstAnnotation()->Id() == "a1");
  assert(document.LastAnnotation()->Id() == "a2");

  assert(document.Annotations().size() == 3);
  assert(document.Annotations(std::string("translit")).size() == 1);
  assert(ThrownCode([&] { document.Annotations(std::string("zz")); }) == ErrorCode::TierIdInvalid);
}

void TestTokenizedLooksDownTheHierarchy() {
  auto document = Words();
  assert(!document.IsTokenized("words", true));

  Tier tokens;
  tokens.id         = "tokens";
  tokens.parent_ref = "translit";
  tokens.Add(Annotation::Referred("k1", "HEL", "r1"));
  tokens.Add(Annotation::Referred("k2", "LO", "r1", std::string("k1")));
  document.AddTier(tokens, eafkit::model::StereoType::SymbolicSubdivision);

  assert(document.IsTokenized("tokens", false));
  assert(!document.IsTokenized("words", false));
  assert(document.IsTokenized("words", true));
  assert(document.GetAnnotation("k2")->MainId() == std::string("a1"));
  assert(ThrownCode([&] { document.IsTokenized("zz", false); }) == ErrorCode::TierIdInvalid);
}

void TestAddAlignableAnnotationKeepsOrder() {
  auto document = Words();

  auto annotation = Annotation::Alignable("a3", "between", "ts5", "ts6");
  annotation.SetTimes(1200, 1500);
  document.AddAnnotation(annotation, "words");

  const auto* words = document.GetTier("words");
  assert(words->Size() == 3);
  assert(words->annotations[2].Id() == "a3");
  assert(*document.TimeslotValue("ts5") == 1200);
  assert(*document.GetAnnotation("a3")->End() == 1500);

  auto early = Annotation::Alignable("a4", "early", "ts1", "ts2");
  assert(ThrownCode([&] { document.AddAnnotation(early, "words"); }) == ErrorCode::AnnotationOverlap);
  assert(document.GetAnnotation("a4") == nullptr);
  assert(document.GetTier("words")->Size() == 3);
}

void TestAddAnnotationRejections() {
  auto document = Words();

  assert(ThrownCode([&] { document.AddAnnotation(Annotation::Alignable("a1", "x", "ts1", "ts2"), "words"); }) ==
         ErrorCode::AnnotationIdExists);
  assert(ThrownCode([&] { document.AddAnnotation(Annotation::Alignable("a9", "x", "ts1", "ts2"), "zz"); }) ==
         ErrorCode::TierIdInvalid);
  assert(ThrownCode([&] { document.AddAnnotation(Annotation::Referred("a9", "x", "a1"), "words"); }) ==
         ErrorCode::AnnotationTypeMismatch);
  assert(ThrownCode([&] { document.AddAnnotation(Annotation::Referred("r9", "x", "zz"), "translit"); }) ==
         ErrorCode::AnnotationIdInvalid);
  assert(document.AnnotationCount() == 3);
}

void TestAddReferredAnnotationAfterSiblings() {
  auto document = Words();
  document.AddAnnotation(Annotation::Referred("r2", "WORLD", "a2"), "translit");
  document.AddAnnotation(Annotation::Referred("r3", "HI", "a1"), "translit");

  const auto* translit = document.GetTier("translit");
  assert(translit->annotations[0].Id() == "r1");
  assert(translit->annotations[1].Id() == "r3");
  assert(translit->annotations[2].Id() == "r2");
  assert(*document.GetAnnotation("r2")->Start() == 500);
}

void TestRemoveAnnotation() {
  auto document = Words();

  assert(ThrownCode([&] { document.RemoveAnnotation("a1"); }) == ErrorCode::AnnotationHasDependents);
  assert(ThrownCode([&] { document.RemoveAnnotation("zz"); }) == ErrorCode::AnnotationIdInvalid);

  document.RemoveAnnotation("a2");
  assert(document.GetAnnotation("a2") == nullptr);
  assert(!document.Exists("ts3").timeslot);
  assert(!document.Exists("ts4").timeslot);

  document.RemoveAnnotation("r1");
  document.RemoveAnnotation("a1");
  assert(document.AnnotationCount() == 0);
  assert(document.Raw().time_order.Empty());
}

void TestAddAndRemoveTier() {
  auto document = Words();

  auto speaker = Tier::MainFromValues({{"hi", 2000, 2500}}, "speaker", 10);
  document.AddTier(speaker);
  assert(document.TierCount() == 3);
  assert(*document.TimeslotValue("ts20") == 2500);
  assert(*document.GetAnnotation("a10")->Start() == 2000);

  assert(ThrownCode([&] { document.AddTier(speaker); }) == ErrorCode::TierIdExists);

  auto clash = Tier::MainFromValues({{"x", 7, 9}}, "clash", 1);
  assert(ThrownCode([&] { document.AddTier(clash); }) == ErrorCode::TimeslotIdExists);

  Tier tags;
  tags.id                  = "tags";
  tags.parent_ref          = "speaker";
  tags.linguistic_type_ref = "tag-lt";
  tags.Add(Annotation::Referred("t1", "greeting", "a10"));
  document.AddTier(tags, eafkit::model::StereoType::SymbolicAssociation);
  assert(document.Raw().HasLinguisticType("tag-lt"));

  assert(ThrownCode([&] { document.RemoveTier("speaker"); }) == ErrorCode::TierHasDependents);
  document.RemoveTier("tags");
  document.RemoveTier("speaker");
  assert(!document.Exists("ts19").timeslot);
  assert(document.TierCount() == 2);
  assert(ThrownCode([&] { document.RemoveTier("speaker"); }) == ErrorCode::TierIdInvalid);
}

void TestAffixTierIdFollowsParentRefs() {
  auto document = Words();
  document.AffixTierId(std::nullopt, "s1-", "");
  assert(document.GetTier("s1-words") != nullptr);
  assert(*document.GetTier("s1-translit")->parent_ref == "s1-words");
  assert(*document.GetAnnotation("r1")->TierId() == "s1-translit");

  document.AffixTierId(std::string("s1-words"), "", "-main");
  assert(*document.GetTier("s1-translit")->parent_ref == "s1-words-main");
  assert(ThrownCode([&] { document.AffixTierId(std::string("zz"), "x", "y"); }) == ErrorCode::TierIdInvalid);
}

void TestShiftIsGuarded() {
  auto document = Words();
  document.Shift(250, false);
  assert(*document.GetAnnotation("r1")->Start() == 250);
  assert(*document.MaxTimeValue() == 1250);

  assert(ThrownCode([&] { document.Shift(-300, false); }) == ErrorCode::ValueTooSmall);
  assert(*document.MinTimeValue() == 250);

  document.Shift(-300, true);
  assert(*document.MinTimeValue() == -50);
}

void TestFromValues() {
  const auto document = AnnotationDocument::FromValues({{"one", 0, 100}, {"two", 100, 300}});
  assert(document.TierIds().front() == "default");
  assert(*document.GetAnnotation("a2")->End() == 300);
  assert(document.Raw().time_order.Size() == 4);
  assert(document.Raw().HasLinguisticType("default-lt"));

  assert(ThrownCode([] { AnnotationDocument::FromValues({}); }) == ErrorCode::NoData);
  assert(ThrownCode([] { AnnotationDocument::FromValues({{"a", 0, 100}, {"b", 50, 150}}); }) == ErrorCode::AnnotationOverlap);
}

void TestFromValuesMulti() {
  const auto document = AnnotationDocument::FromValuesMulti(
      {{"s2", {"x", 0, 10}}, {"s1", {"y", 0, 20}}, {"s2", {"z", 10, 30}}});

  const auto ids = document.TierIds();
  assert(ids.size() == 2);
  assert(ids[0] == "s2");
  assert(ids[1] == "s1");
  assert(document.GetTier("s2")->Size() == 2);
  assert(*document.GetAnnotation("a3")->TierId() == "s1");
  assert(document.Raw().time_order.Size() == 6);
}

void TestToTemplateKeepsStructureOnly() {
  const auto document = Words();
  const auto tmpl     = document.ToTemplate();
  assert(tmpl.tiers.size() == 2);
  assert(tmpl.AnnotationCount() == 0);
  assert(tmpl.time_order.Empty());
  assert(*tmpl.FindTier("translit")->parent_ref == "words");
  assert(tmpl.author == "test");
}

void TestIdGeneration() {
  auto document = Words();
  assert(document.GenerateTimeslotId() == "ts5");
  assert(document.GenerateAnnotationId() == "a3");

  const auto ids = document.GenerateAnnotationIds(2);
  assert(ids[0] == "a3");
  assert(ids[1] == "a4");

  assert(document.AddTimeslot(std::nullopt, 42) == "ts5");
  assert(*document.TimeslotId(42) == "ts5");
  assert(ThrownCode([&] { document.AddTimeslot(std::string("ts1"), 1); }) == ErrorCode::TimeslotIdExists);
}

void TestRemapInPlace() {
  auto document = Words();
  document.Remap(10, 20);
  assert(document.GetAnnotation("a10") != nullptr);
  assert(document.GetAnnotation("a12")->RefId() == std::string("a10"));
  assert(*document.TimeslotValue("ts23") == 1000);
  assert(*document.GetAnnotation("a12")->End() == 500);
}

} // namespace

int main() {
  TestCreateDerivesEverything();
  TestCreateRejectsBrokenStructure();
  TestTierQueries();
  TestExistsLooksInEveryNamespace();
  TestTimeQueries();
  TestTokenizedLooksDownTheHierarchy();
  TestAddAlignableAnnotationKeepsOrder();
  TestAddAnnotationRejections();
  TestAddReferredAnnotationAfterSiblings();
  TestRemoveAnnotation();
  TestAddAndRemoveTier();
  TestAffixTierIdFollowsParentRefs();
  TestShiftIsGuarded();
  TestFromValues();
  TestFromValuesMulti();
  TestToTemplateKeepsStructureOnly();
  TestIdGeneration();
  TestRemapInPlace();

  std::cout << "eafkit_unit_annotation_document: pass\n";
  return 0;
}
