#pragma once

#include <string>

#include "eafkit/v1.hpp"
#include "internal/model/document.hpp"

namespace eafkit::codec {

/*
  Snapshot persistence of the raw document through protobuf.

  Only persisted fields travel; derived values are recomputed when the
  decoded document goes through core::AnnotationDocument::Create.
  Failures raise util::CodecError (DecodeError / IOError).
*/

eafkit::v1::Document ToProto(const model::Document& document);
model::Document      FromProto(const eafkit::v1::Document& proto);

std::string     EncodeJson(const model::Document& document);
model::Document DecodeJson(const std::string& json);

std::string     EncodeBinary(const model::Document& document);
model::Document DecodeBinary(const std::string& bytes);

// JSON when path ends in ".json", binary protobuf otherwise.
model::Document ReadFile(const std::string& path);
void            WriteFile(const std::string& path, const model::Document& document);

} // namespace eafkit::codec
