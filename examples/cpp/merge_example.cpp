#include <iostream>
#include <vector>

#include "internal/core/annotation_document.hpp"
#include "internal/util/errors.hpp"

int main() {
  try {
    // Two sessions of the same speaker, annotated separately.
    auto morning   = eafkit::core::AnnotationDocument::FromValues({{"one", 0, 400}, {"three", 800, 1200}}, "speaker1");
    auto afternoon = eafkit::core::AnnotationDocument::FromValues({{"two", 400, 800}, {"four", 1200, 1600}}, "speaker1");

    std::vector<eafkit::model::Document> inputs{morning.Raw(), afternoon.Raw()};
    const auto merged = eafkit::core::AnnotationDocument::Merge(std::move(inputs));

    for (const auto& annotation : merged.Annotations()) {
      std::cout << annotation.Id() << ' ' << annotation.Value().Str() << " [" << *annotation.Start() << ", " << *annotation.End()
                << "]\n";
    }

    // Cut out the middle and move it to the origin.
    const auto window = merged.Extract(400, 1200);
    std::cout << "window annotations=" << window.AnnotationCount() << " max_ms=" << *window.MaxTimeValue() << '\n';
  } catch (const eafkit::util::EafError& e) {
    std::cerr << "merge failed: " << eafkit::util::ToString(e.code()) << ": " << e.what() << '\n';
    return 1;
  }

  return 0;
}
