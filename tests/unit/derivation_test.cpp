#include <cassert>
#include <iostream>

#include "internal/derive/derivation_engine.hpp"
#include "internal/index/reference_index.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_documents.hpp"

namespace {

using eafkit::model::Annotation;
using eafkit::model::Document;
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

void Run(Document& document) {
  const auto index = eafkit::index::Build(document);
  eafkit::derive::Derive(document, index);
}

// words / translit plus a raw referred tier, skipping DocumentBuilder checks.
Document WithReferredTier(std::vector<Annotation> annotations) {
  Document document = eafkit::testing::WordsDocument();
  Tier     extra;
  extra.id         = "extra";
  extra.parent_ref = "translit";
  extra.annotations = std::move(annotations);
  document.tiers.push_back(std::move(extra));
  return document;
}

void TestReferredInheritsMainSpan() {
  auto document = eafkit::testing::WordsDocument();
  Run(document);

  const auto* r1 = document.FindTier("translit")->Find("r1");
  assert(*r1->TierId() == "translit");
  assert(*r1->Start() == 0);
  assert(*r1->End() == 500);
  assert(*r1->MainId() == "a1");

  const auto* a2 = document.FindTier("words")->Find("a2");
  assert(*a2->Start() == 500);
  assert(*a2->End() == 1000);
  assert(!a2->MainId().has_value());
}

void TestChainOfReferredTiers() {
  auto document = WithReferredTier({Annotation::Referred("x1", "h", "r1")});
  Run(document);

  const auto* x1 = document.FindTier("extra")->Find("x1");
  assert(*x1->MainId() == "a1");
  assert(*x1->End() == 500);
}

void TestDeriveIsIdempotent() {
  auto document = eafkit::testing::WordsDocument();
  Run(document);
  const auto once = document;
  Run(document);

  const auto* before = once.FindTier("translit")->Find("r1");
  const auto* after  = document.FindTier("translit")->Find("r1");
  assert(before->IsIdentical(*after, true));
  assert(before->MainId() == after->MainId());
  assert(once == document);
}

void TestCycleIsRejected() {
  auto document = WithReferredTier({Annotation::Referred("x1", "h", "x2"), Annotation::Referred("x2", "h", "x1")});
  assert(ThrownCode([&] { Run(document); }) == ErrorCode::AnnotationRefCycle);
  assert(!document.FindTier("words")->Find("a1")->Start().has_value());
}

void TestSelfReferenceIsACycle() {
  auto document = WithReferredTier({Annotation::Referred("x1", "h", "x1")});
  assert(ThrownCode([&] { Run(document); }) == ErrorCode::AnnotationRefCycle);
}

void TestMissingParentAnnotation() {
  auto document = WithReferredTier({Annotation::Referred("x1", "h", "nope")});
  assert(ThrownCode([&] { Run(document); }) == ErrorCode::AnnotationMainMissing);
}

void TestMissingTimeslot() {
  auto document = eafkit::testing::WordsDocument();
  document.tiers[0].annotations[1].SetTimeSlotRefs("ts3", "ts9");
  assert(ThrownCode([&] { Run(document); }) == ErrorCode::TimeslotRefMissing);
}

void TestUnvaluedSlotGivesUnknownTime() {
  auto document       = eafkit::testing::WordsDocument();
  document.time_order = eafkit::model::TimeOrder({{"ts1", 0}, {"ts2", std::nullopt}, {"ts3", 500}, {"ts4", 1000}});
  Run(document);

  const auto* r1 = document.FindTier("translit")->Find("r1");
  assert(*r1->Start() == 0);
  assert(!r1->End().has_value());
}

} // namespace

int main() {
  TestReferredInheritsMainSpan();
  TestChainOfReferredTiers();
  TestDeriveIsIdempotent();
  TestCycleIsRejected();
  TestSelfReferenceIsACycle();
  TestMissingParentAnnotation();
  TestMissingTimeslot();
  TestUnvaluedSlotGivesUnknownTime();

  std::cout << "eafkit_unit_derivation: pass\n";
  return 0;
}
