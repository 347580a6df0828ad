#include <iostream>
#include <string>

#include "eafkit/v1.hpp"
#include "internal/codec/document_codec.hpp"
#include "internal/core/annotation_document.hpp"
#include "internal/util/errors.hpp"

int main(int argc, char** argv) {
  const std::string path = argc > 1 ? argv[1] : "round_trip.json";

  try {
    // Two aligned utterances plus a translation tier referring to them.
    auto document = eafkit::core::AnnotationDocument::FromValues({{"hello there", 0, 1200}, {"good bye", 1500, 2300}}, "speaker");

    const auto* speaker = document.GetTier("speaker");
    auto translation = eafkit::model::Tier::RefFromValues({"hallo", "tschuess"}, "translation", *speaker, "translation-lt",
                                                          document.AnnotationCount() + 1);
    document.AddTier(translation, eafkit::model::StereoType::SymbolicAssociation);

    eafkit::codec::WriteFile(path, document.Raw());

    // Derived values are rebuilt on load.
    const auto reloaded = eafkit::core::AnnotationDocument::Create(eafkit::codec::ReadFile(path));
    for (const auto& annotation : reloaded.Annotations(std::string("translation"))) {
      std::cout << annotation.Id() << " '" << annotation.Value().Str() << "' [" << *annotation.Start() << ", " << *annotation.End()
                << "] main=" << *annotation.MainId() << '\n';
    }

    // The wire type is available to callers that speak protobuf directly.
    const eafkit::v1::Document proto = eafkit::codec::ToProto(reloaded.Raw());
    std::cout << "tiers=" << proto.tiers_size() << " time_slots=" << proto.time_slots_size() << '\n';
  } catch (const eafkit::util::EafError& e) {
    std::cerr << "round trip failed: " << eafkit::util::ToString(e.code()) << ": " << e.what() << '\n';
    return 1;
  }

  return 0;
}
