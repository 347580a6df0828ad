#include "internal/codec/document_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iterator>
#include <optional>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace eafkit::codec {
namespace {

using OptionalString = std::optional<std::string>;

// ------------------------------------------------------------
// Enum mapping
// ------------------------------------------------------------

eafkit::v1::StereoType ToProto(model::StereoType stereotype) {
  switch (stereotype) {
    case model::StereoType::IncludedIn:
      return eafkit::v1::STEREO_TYPE_INCLUDED_IN;
    case model::StereoType::SymbolicAssociation:
      return eafkit::v1::STEREO_TYPE_SYMBOLIC_ASSOCIATION;
    case model::StereoType::SymbolicSubdivision:
      return eafkit::v1::STEREO_TYPE_SYMBOLIC_SUBDIVISION;
    case model::StereoType::TimeSubdivision:
      return eafkit::v1::STEREO_TYPE_TIME_SUBDIVISION;
  }
  return eafkit::v1::STEREO_TYPE_UNSPECIFIED;
}

std::optional<model::StereoType> FromProto(eafkit::v1::StereoType stereotype) {
  switch (stereotype) {
    case eafkit::v1::STEREO_TYPE_INCLUDED_IN:
      return model::StereoType::IncludedIn;
    case eafkit::v1::STEREO_TYPE_SYMBOLIC_ASSOCIATION:
      return model::StereoType::SymbolicAssociation;
    case eafkit::v1::STEREO_TYPE_SYMBOLIC_SUBDIVISION:
      return model::StereoType::SymbolicSubdivision;
    case eafkit::v1::STEREO_TYPE_TIME_SUBDIVISION:
      return model::StereoType::TimeSubdivision;
    case eafkit::v1::STEREO_TYPE_UNSPECIFIED:
      return std::nullopt;
    default:
      throw util::DecodeError("unknown stereotype " + std::to_string(static_cast<int>(stereotype)));
  }
}

// ------------------------------------------------------------
// model -> proto
// ------------------------------------------------------------

void ToProto(const model::Annotation& annotation, eafkit::v1::Annotation* out) {
  out->set_id(annotation.Id());
  out->set_value(annotation.Value().Str());
  if (annotation.ExtRef())
    out->set_ext_ref(*annotation.ExtRef());
  if (annotation.LangRef())
    out->set_lang_ref(*annotation.LangRef());
  if (annotation.CveRef())
    out->set_cve_ref(*annotation.CveRef());

  if (auto refs = annotation.TimeSlotRefs()) {
    auto* alignable = out->mutable_alignable();
    alignable->set_time_slot_ref1(refs->first);
    alignable->set_time_slot_ref2(refs->second);
  } else {
    auto* referred = out->mutable_referred();
    referred->set_annotation_ref(*annotation.RefId());
    if (auto previous = annotation.Previous())
      referred->set_previous(*previous);
  }
}

void ToProto(const model::Tier& tier, eafkit::v1::Tier* out) {
  out->set_id(tier.id);
  out->set_linguistic_type_ref(tier.linguistic_type_ref);
  if (tier.participant)
    out->set_participant(*tier.participant);
  if (tier.annotator)
    out->set_annotator(*tier.annotator);
  if (tier.default_locale)
    out->set_default_locale(*tier.default_locale);
  if (tier.parent_ref)
    out->set_parent_ref(*tier.parent_ref);
  if (tier.ext_ref)
    out->set_ext_ref(*tier.ext_ref);
  if (tier.lang_ref)
    out->set_lang_ref(*tier.lang_ref);

  for (const auto& annotation : tier.annotations) {
    ToProto(annotation, out->add_annotations());
  }
}

void ToProto(const model::LinguisticType& lt, eafkit::v1::LinguisticType* out) {
  out->set_id(lt.id);
  if (lt.time_alignable)
    out->set_time_alignable(*lt.time_alignable);
  if (lt.constraint)
    out->set_constraint(ToProto(*lt.constraint));
  if (lt.graphic_references)
    out->set_graphic_references(*lt.graphic_references);
  if (lt.controlled_vocabulary)
    out->set_controlled_vocabulary(*lt.controlled_vocabulary);
  if (lt.ext_ref)
    out->set_ext_ref(*lt.ext_ref);
  if (lt.lexicon_ref)
    out->set_lexicon_ref(*lt.lexicon_ref);
}

void ToProto(const model::ControlledVocabulary& cv, eafkit::v1::ControlledVocabulary* out) {
  out->set_id(cv.id);
  if (cv.description)
    out->set_description(*cv.description);
  if (cv.ext_ref)
    out->set_ext_ref(*cv.ext_ref);

  for (const auto& entry : cv.entries) {
    auto* e = out->add_entries();
    e->set_id(entry.id);
    e->set_value(entry.value);
    if (entry.description)
      e->set_description(*entry.description);
    if (entry.ext_ref)
      e->set_ext_ref(*entry.ext_ref);
    if (entry.language_ref)
      e->set_language_ref(*entry.language_ref);
  }
}

// ------------------------------------------------------------
// proto -> model
// ------------------------------------------------------------

model::Annotation FromProto(const eafkit::v1::Annotation& in) {
  model::Annotation annotation;
  switch (in.refs_case()) {
    case eafkit::v1::Annotation::kAlignable:
      annotation = model::Annotation::Alignable(in.id(), in.value(), in.alignable().time_slot_ref1(), in.alignable().time_slot_ref2());
      break;
    case eafkit::v1::Annotation::kReferred:
      annotation = model::Annotation::Referred(in.id(), in.value(), in.referred().annotation_ref(),
                                               in.referred().has_previous() ? OptionalString(in.referred().previous()) : std::nullopt);
      break;
    default:
      throw util::DecodeError("annotation '" + in.id() + "' is neither alignable nor referred");
  }

  if (in.has_ext_ref())
    annotation.SetExtRef(in.ext_ref());
  if (in.has_lang_ref())
    annotation.SetLangRef(in.lang_ref());
  if (in.has_cve_ref())
    annotation.SetCveRef(in.cve_ref());
  return annotation;
}

model::Tier FromProto(const eafkit::v1::Tier& in) {
  model::Tier tier;
  tier.id                  = in.id();
  tier.linguistic_type_ref = in.linguistic_type_ref();
  if (in.has_participant())
    tier.participant = in.participant();
  if (in.has_annotator())
    tier.annotator = in.annotator();
  if (in.has_default_locale())
    tier.default_locale = in.default_locale();
  if (in.has_parent_ref())
    tier.parent_ref = in.parent_ref();
  if (in.has_ext_ref())
    tier.ext_ref = in.ext_ref();
  if (in.has_lang_ref())
    tier.lang_ref = in.lang_ref();

  tier.annotations.reserve(in.annotations_size());
  for (const auto& annotation : in.annotations()) {
    tier.annotations.push_back(FromProto(annotation));
  }
  return tier;
}

model::LinguisticType FromProto(const eafkit::v1::LinguisticType& in) {
  model::LinguisticType lt;
  lt.id         = in.id();
  lt.constraint = FromProto(in.constraint());
  if (in.has_time_alignable())
    lt.time_alignable = in.time_alignable();
  if (in.has_graphic_references())
    lt.graphic_references = in.graphic_references();
  if (in.has_controlled_vocabulary())
    lt.controlled_vocabulary = in.controlled_vocabulary();
  if (in.has_ext_ref())
    lt.ext_ref = in.ext_ref();
  if (in.has_lexicon_ref())
    lt.lexicon_ref = in.lexicon_ref();
  return lt;
}

model::ControlledVocabulary FromProto(const eafkit::v1::ControlledVocabulary& in) {
  model::ControlledVocabulary cv;
  cv.id = in.id();
  if (in.has_description())
    cv.description = in.description();
  if (in.has_ext_ref())
    cv.ext_ref = in.ext_ref();

  for (const auto& e : in.entries()) {
    model::CvEntry entry;
    entry.id    = e.id();
    entry.value = e.value();
    if (e.has_description())
      entry.description = e.description();
    if (e.has_ext_ref())
      entry.ext_ref = e.ext_ref();
    if (e.has_language_ref())
      entry.language_ref = e.language_ref();
    cv.entries.push_back(std::move(entry));
  }
  return cv;
}

bool HasJsonExtension(const std::string& path) {
  constexpr std::string_view kExtension = ".json";
  return path.size() >= kExtension.size() && path.compare(path.size() - kExtension.size(), kExtension.size(), kExtension) == 0;
}

} // namespace

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------

eafkit::v1::Document ToProto(const model::Document& document) {
  eafkit::v1::Document out;
  out.set_author(document.author);
  out.set_date(document.date);
  out.set_format(document.format);
  out.set_version(document.version);

  for (const auto& slot : document.time_order.Slots()) {
    auto* s = out.add_time_slots();
    s->set_id(slot.id);
    if (slot.value)
      s->set_value(*slot.value);
  }
  for (const auto& tier : document.tiers) {
    ToProto(tier, out.add_tiers());
  }
  for (const auto& lt : document.linguistic_types) {
    ToProto(lt, out.add_linguistic_types());
  }
  for (const auto& locale : document.locales) {
    auto* l = out.add_locales();
    l->set_language_code(locale.language_code);
    if (locale.country_code)
      l->set_country_code(*locale.country_code);
    if (locale.variant)
      l->set_variant(*locale.variant);
  }
  for (const auto& language : document.languages) {
    auto* l = out.add_languages();
    l->set_id(language.id);
    if (language.definition)
      l->set_definition(*language.definition);
    if (language.label)
      l->set_label(*language.label);
  }
  for (const auto& constraint : document.constraints) {
    auto* c = out.add_constraints();
    c->set_description(constraint.description);
    c->set_stereotype(ToProto(constraint.stereotype));
  }
  for (const auto& cv : document.controlled_vocabularies) {
    ToProto(cv, out.add_controlled_vocabularies());
  }
  return out;
}

model::Document FromProto(const eafkit::v1::Document& in) {
  model::Document document;
  document.author  = in.author();
  document.date    = in.date();
  document.format  = in.format();
  document.version = in.version();

  std::vector<model::TimeSlot> slots;
  slots.reserve(in.time_slots_size());
  for (const auto& s : in.time_slots()) {
    slots.push_back(model::TimeSlot{s.id(), s.has_value() ? std::optional<int64_t>(s.value()) : std::nullopt});
  }
  document.time_order = model::TimeOrder(std::move(slots));

  for (const auto& tier : in.tiers()) {
    document.tiers.push_back(FromProto(tier));
  }
  for (const auto& lt : in.linguistic_types()) {
    document.linguistic_types.push_back(FromProto(lt));
  }
  for (const auto& l : in.locales()) {
    document.locales.push_back(model::Locale{l.language_code(), l.has_country_code() ? OptionalString(l.country_code()) : std::nullopt,
                                             l.has_variant() ? OptionalString(l.variant()) : std::nullopt});
  }
  for (const auto& l : in.languages()) {
    document.languages.push_back(model::Language{l.id(), l.has_definition() ? OptionalString(l.definition()) : std::nullopt,
                                                 l.has_label() ? OptionalString(l.label()) : std::nullopt});
  }
  for (const auto& c : in.constraints()) {
    auto stereotype = FromProto(c.stereotype());
    if (!stereotype) {
      throw util::DecodeError("constraint without stereotype");
    }
    document.constraints.push_back(model::Constraint{c.description(), *stereotype});
  }
  for (const auto& cv : in.controlled_vocabularies()) {
    document.controlled_vocabularies.push_back(FromProto(cv));
  }
  return document;
}

std::string EncodeJson(const model::Document& document) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(document), &json, options);
  if (!status.ok()) {
    throw util::DecodeError("failed to encode JSON: " + std::string(status.message()));
  }
  return json;
}

model::Document DecodeJson(const std::string& json) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  eafkit::v1::Document proto;
  auto                 status = google::protobuf::util::JsonStringToMessage(json, &proto, options);
  if (!status.ok()) {
    throw util::DecodeError(std::string(status.message()));
  }
  return FromProto(proto);
}

std::string EncodeBinary(const model::Document& document) {
  std::string bytes;
  if (!ToProto(document).SerializeToString(&bytes)) {
    throw util::DecodeError("failed to serialize document");
  }
  return bytes;
}

model::Document DecodeBinary(const std::string& bytes) {
  eafkit::v1::Document proto;
  if (!proto.ParseFromString(bytes)) {
    throw util::DecodeError("malformed protobuf document");
  }
  return FromProto(proto);
}

model::Document ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::IOError("cannot open '" + path + "' for reading");
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw util::IOError("failed reading '" + path + "'");
  }

  auto document = HasJsonExtension(path) ? DecodeJson(content) : DecodeBinary(content);
  EAFKIT_LOG_DEBUG("read document", {observability::StringField("path", path),
                                     observability::IntField("tiers", static_cast<int64_t>(document.tiers.size()))});
  return document;
}

void WriteFile(const std::string& path, const model::Document& document) {
  const std::string content = HasJsonExtension(path) ? EncodeJson(document) : EncodeBinary(document);

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw util::IOError("cannot open '" + path + "' for writing");
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  if (!out) {
    throw util::IOError("failed writing '" + path + "'");
  }

  EAFKIT_LOG_DEBUG("wrote document", {observability::StringField("path", path),
                                      observability::IntField("bytes", static_cast<int64_t>(content.size()))});
}

} // namespace eafkit::codec
