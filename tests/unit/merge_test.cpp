#include <cassert>
#include <iostream>
#include <set>

#include "internal/core/annotation_document.hpp"
#include "internal/merge/merge_engine.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_documents.hpp"

namespace {

using eafkit::core::AnnotationDocument;
using eafkit::merge::MergeOptions;
using eafkit::merge::OverlapStrategy;
using eafkit::model::Document;
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

void TestInterleavesSameTier() {
  auto first  = eafkit::testing::SingleTierDocument("speaker1", {{0, 100}, {200, 300}, {400, 500}});
  auto second = eafkit::testing::SingleTierDocument("speaker1", {{100, 200}, {300, 400}});

  const auto merged = AnnotationDocument::Merge({first, second});

  assert(merged.TierCount() == 1);
  const auto* speaker = merged.GetTier("speaker1");
  assert(speaker->Size() == 5);
  for (std::size_t i = 0; i < speaker->Size(); ++i) {
    assert(speaker->annotations[i].Id() == "a" + std::to_string(i + 1));
    assert(*speaker->annotations[i].Start() == static_cast<int64_t>(i) * 100);
  }
  assert(merged.Raw().time_order.Size() == 10);
  assert(speaker->annotations[1].Value().Str() == "v1");
}

void TestCollidingIdsBecomeUnique() {
  auto first  = eafkit::testing::SingleTierDocument("left", {{0, 100}});
  auto second = eafkit::testing::SingleTierDocument("right", {{0, 100}});

  const auto merged = AnnotationDocument::Merge({first, second});

  std::set<std::string> ids;
  for (const auto& annotation : merged.Annotations()) {
    ids.insert(annotation.Id());
  }
  assert(ids.size() == 2);
  assert(merged.Raw().time_order.Size() == 4);
  assert(merged.TierIds()[0] == "left");
}

void TestReferredTiersFollowTheirParents() {
  auto first  = eafkit::testing::WordsDocument();
  auto second = eafkit::testing::SingleTierDocument("words", {{2000, 2500}});

  const auto merged = AnnotationDocument::Merge({first, second});

  assert(merged.GetTier("words")->Size() == 3);
  const auto* translit = merged.GetTier("translit");
  assert(translit->Size() == 1);

  const auto& r1 = translit->annotations[0];
  assert(merged.MainAnnotation(r1.Id())->Value().Str() == "hello");
  assert(*r1.End() == 500);
  assert(merged.GetTier("words")->annotations.back().Value().Str() == "v1");
}

void TestMetadataIsUnioned() {
  auto first  = eafkit::testing::WordsDocument();
  auto second = eafkit::testing::SingleTierDocument("other", {{2000, 2500}});
  second.linguistic_types.push_back(eafkit::model::LinguisticType::Create("gloss", eafkit::model::StereoType::SymbolicAssociation));
  second.locales.push_back(eafkit::model::Locale{"en", std::nullopt, std::nullopt});

  const auto merged = AnnotationDocument::Merge({first, second});
  assert(merged.Raw().HasLinguisticType("default-lt"));
  assert(merged.Raw().HasLinguisticType("gloss"));
  assert(merged.Raw().linguistic_types.size() == 2);
  assert(merged.Raw().locales.size() == 1);
  assert(merged.Raw().author == "test");
}

void TestTierKindClash() {
  auto main_words = eafkit::testing::SingleTierDocument("words", {{5000, 6000}});

  Document referred_words = eafkit::testing::WordsDocument();
  referred_words.tiers[0].id         = "base";
  referred_words.tiers[1].id         = "words";
  referred_words.tiers[1].parent_ref = "base";

  assert(ThrownCode([&] { AnnotationDocument::Merge({main_words, referred_words}); }) == ErrorCode::TierTypeMismatch);
}

void TestOverlapAcrossInputs() {
  auto first  = eafkit::testing::SingleTierDocument("s", {{0, 100}});
  auto second = eafkit::testing::SingleTierDocument("s", {{50, 150}});
  assert(ThrownCode([&] { AnnotationDocument::Merge({first, second}); }) == ErrorCode::AnnotationOverlap);
}

void TestEmptyInputAndStrategies() {
  assert(ThrownCode([] { AnnotationDocument::Merge({}); }) == ErrorCode::NoData);

  MergeOptions options;
  options.overlap_strategy = OverlapStrategy::kJoin;
  auto single              = eafkit::testing::SingleTierDocument("s", {{0, 100}});
  assert(ThrownCode([&] { AnnotationDocument::Merge({single}, options); }) == ErrorCode::Unsupported);
}

void TestSingleInputIsRenumbered() {
  const auto merged = AnnotationDocument::Merge({eafkit::testing::WordsDocument()});
  assert(merged.AnnotationCount() == 3);
  assert(merged.TierIds()[0] == "translit");
  assert(*merged.GetAnnotation("a1")->RefId() == "a2");
  assert(merged.GetAnnotation("a2")->Value().Str() == "hello");
}

void TestMergeTiers() {
  auto left  = eafkit::model::Tier::MainFromValues({{"b", 100, 200}}, "t", 1);
  auto right = eafkit::model::Tier::MainFromValues({{"a", 0, 100}}, "t", 2);

  const auto merged = eafkit::merge::MergeTiers({left, right});
  assert(merged.Size() == 2);
  assert(merged.annotations[0].Value().Str() == "a");

  auto referred       = right;
  referred.parent_ref = "x";
  assert(ThrownCode([&] { eafkit::merge::MergeTiers({left, referred}); }) == ErrorCode::TierTypeMismatch);
  assert(ThrownCode([] { eafkit::merge::MergeTiers({}); }) == ErrorCode::NoData);
}

} // namespace

int main() {
  TestInterleavesSameTier();
  TestCollidingIdsBecomeUnique();
  TestReferredTiersFollowTheirParents();
  TestMetadataIsUnioned();
  TestTierKindClash();
  TestOverlapAcrossInputs();
  TestEmptyInputAndStrategies();
  TestSingleInputIsRenumbered();
  TestMergeTiers();

  std::cout << "eafkit_unit_merge: pass\n";
  return 0;
}
