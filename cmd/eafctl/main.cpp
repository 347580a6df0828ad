#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/cli/exit_status.hpp"
#include "internal/codec/document_codec.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/annotation_document.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/validate/validation.hpp"

using eafkit::cli::ExitStatus;
using eafkit::core::AnnotationDocument;
using eafkit::observability::IntField;
using eafkit::observability::StringField;

namespace {

using RuntimeConfig = eafkit::runtime::config::RuntimeConfig;

void Usage() {
  std::cout << "Usage:\n"
            << "  eafctl [--config <file.yaml>] info <doc>\n"
            << "  eafctl [--config <file.yaml>] validate <doc>\n"
            << "  eafctl [--config <file.yaml>] remap <in> <out> [annotation_start] [timeslot_start]\n"
            << "  eafctl [--config <file.yaml>] extract <in> <out> <start_ms> <end_ms>\n"
            << "  eafctl [--config <file.yaml>] shift <in> <out> <shift_ms>\n"
            << "  eafctl [--config <file.yaml>] merge <out> <in> [<in> ...]\n"
            << "  eafctl [--config <file.yaml>] from-values <out> <tier_id> <value:start_ms:end_ms> ...\n"
            << "\n"
            << "Documents ending in .json are read and written as JSON, others as binary protobuf.\n";
}

struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

int64_t ParseInt(const std::string& text, const char* what) {
  const auto invalid = UsageError(std::string("invalid ") + what + ": '" + text + "'");

  std::size_t consumed = 0;
  int64_t     value    = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::logic_error&) {
    throw invalid;
  }
  if (consumed != text.size()) {
    throw invalid;
  }
  return value;
}

// "value:start:end", value may itself contain ':'.
eafkit::model::TimedValue ParseTimedValue(const std::string& text) {
  const auto end_sep = text.rfind(':');
  if (end_sep == std::string::npos || end_sep == 0) {
    throw UsageError("expected value:start_ms:end_ms, got '" + text + "'");
  }
  const auto start_sep = text.rfind(':', end_sep - 1);
  if (start_sep == std::string::npos) {
    throw UsageError("expected value:start_ms:end_ms, got '" + text + "'");
  }

  eafkit::model::TimedValue value;
  value.value    = text.substr(0, start_sep);
  value.start_ms = ParseInt(text.substr(start_sep + 1, end_sep - start_sep - 1), "start_ms");
  value.end_ms   = ParseInt(text.substr(end_sep + 1), "end_ms");
  return value;
}

AnnotationDocument Load(const std::string& path, const RuntimeConfig& config) {
  auto document = AnnotationDocument::Create(eafkit::codec::ReadFile(path));

  const auto& engine = config.engine();
  if (!engine.has_validate_overlaps_on_load() || engine.validate_overlaps_on_load()) {
    if (auto overlapping = eafkit::validate::OverlappingTiers(document.Raw()); !overlapping.empty()) {
      throw eafkit::util::AnnotationOverlap(overlapping.front());
    }
  }
  return document;
}

void Save(const std::string& path, const AnnotationDocument& document) {
  eafkit::codec::WriteFile(path, document.Raw());
  EAFKIT_LOG_INFO("document written", {StringField("path", path), IntField("tiers", static_cast<int64_t>(document.TierCount())),
                                        IntField("annotations", static_cast<int64_t>(document.AnnotationCount()))});
}

std::string OrNone(const std::optional<int64_t>& value) {
  return value ? std::to_string(*value) : "none";
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

int Info(const std::vector<std::string>& args, const RuntimeConfig& config) {
  if (args.size() != 1) throw UsageError("info takes one document");

  auto document = Load(args[0], config);

  std::cout << "tiers=" << document.TierCount() << "\n";
  std::cout << "main_tiers=" << document.MainTierIds().size() << "\n";
  std::cout << "ref_tiers=" << document.RefTierIds().size() << "\n";
  std::cout << "annotations=" << document.AnnotationCount() << "\n";
  std::cout << "timeslots=" << document.Raw().time_order.Size() << "\n";
  std::cout << "min_ms=" << OrNone(document.MinTimeValue()) << "\n";
  std::cout << "max_ms=" << OrNone(document.MaxTimeValue()) << "\n";
  for (const auto* tier : document.MainTiers()) {
    std::cout << "tier " << tier->id << " annotations=" << tier->Size() << "\n";
  }
  for (const auto* tier : document.RefTiers()) {
    std::cout << "tier " << tier->id << " parent=" << *tier->parent_ref << " annotations=" << tier->Size() << "\n";
  }
  return eafkit::cli::kExitOk;
}

int Validate(const std::vector<std::string>& args, const RuntimeConfig&) {
  if (args.size() != 1) throw UsageError("validate takes one document");

  // Overlaps are reported below, whatever the load setting.
  auto document = AnnotationDocument::Create(eafkit::codec::ReadFile(args[0]));

  const auto overlapping = eafkit::validate::OverlappingTiers(document.Raw());
  for (const auto& tier_id : overlapping) {
    std::cout << "overlap in tier " << tier_id << "\n";
  }
  if (!overlapping.empty()) {
    return eafkit::cli::kExitIntegrity;
  }

  std::cout << "ok\n";
  return eafkit::cli::kExitOk;
}

int Remap(const std::vector<std::string>& args, const RuntimeConfig& config) {
  if (args.size() < 2 || args.size() > 4) throw UsageError("remap takes <in> <out> [annotation_start] [timeslot_start]");

  const int64_t annotation_start = args.size() >= 3 ? ParseInt(args[2], "annotation_start") : 1;
  const int64_t timeslot_start   = args.size() >= 4 ? ParseInt(args[3], "timeslot_start") : 1;
  if (annotation_start < 0 || timeslot_start < 0) throw UsageError("start offsets must not be negative");

  auto document = Load(args[0], config);
  document.Remap(static_cast<std::size_t>(annotation_start), static_cast<std::size_t>(timeslot_start));
  Save(args[1], document);
  return eafkit::cli::kExitOk;
}

int Extract(const std::vector<std::string>& args, const RuntimeConfig& config) {
  if (args.size() != 4) throw UsageError("extract takes <in> <out> <start_ms> <end_ms>");

  const int64_t start_ms = ParseInt(args[2], "start_ms");
  const int64_t end_ms   = ParseInt(args[3], "end_ms");

  auto document = Load(args[0], config);
  Save(args[1], document.Extract(start_ms, end_ms));
  return eafkit::cli::kExitOk;
}

int Shift(const std::vector<std::string>& args, const RuntimeConfig& config) {
  if (args.size() != 3) throw UsageError("shift takes <in> <out> <shift_ms>");

  const int64_t shift_ms = ParseInt(args[2], "shift_ms");

  auto document = Load(args[0], config);
  document.Shift(shift_ms, config.engine().allow_negative_shift());
  Save(args[1], document);
  return eafkit::cli::kExitOk;
}

int Merge(const std::vector<std::string>& args, const RuntimeConfig& config) {
  if (args.size() < 2) throw UsageError("merge takes <out> <in> [<in> ...]");

  std::vector<eafkit::model::Document> inputs;
  for (std::size_t i = 1; i < args.size(); ++i) {
    inputs.push_back(eafkit::codec::ReadFile(args[i]));
  }

  auto merged = AnnotationDocument::Merge(std::move(inputs), eafkit::config::ToMergeOptions(config));
  Save(args[0], merged);
  return eafkit::cli::kExitOk;
}

int FromValues(const std::vector<std::string>& args, const RuntimeConfig&) {
  if (args.size() < 3) throw UsageError("from-values takes <out> <tier_id> <value:start_ms:end_ms> ...");

  std::vector<eafkit::model::TimedValue> values;
  for (std::size_t i = 2; i < args.size(); ++i) {
    values.push_back(ParseTimedValue(args[i]));
  }

  Save(args[0], AnnotationDocument::FromValues(values, args[1]));
  return eafkit::cli::kExitOk;
}

int Dispatch(const std::string& cmd, const std::vector<std::string>& args, const RuntimeConfig& config) {
  if (cmd == "info") return Info(args, config);
  if (cmd == "validate") return Validate(args, config);
  if (cmd == "remap") return Remap(args, config);
  if (cmd == "extract") return Extract(args, config);
  if (cmd == "shift") return Shift(args, config);
  if (cmd == "merge") return Merge(args, config);
  if (cmd == "from-values") return FromValues(args, config);
  throw UsageError("unknown command '" + cmd + "'");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty() || args[0] == "-h" || args[0] == "--help") {
    Usage();
    return args.empty() ? eafkit::cli::kExitUsage : eafkit::cli::kExitOk;
  }

  const std::string cmd = args[0];
  args.erase(args.begin());

  RuntimeConfig config;
  try {
    config = config_path.empty() ? eafkit::config::ConfigLoader::Defaults() : eafkit::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return eafkit::cli::kExitInput;
  }

  eafkit::observability::InitializeLogging(config, eafkit::observability::LogSink::Stderr);

  int status = eafkit::cli::kExitOk;
  try {
    status = Dispatch(cmd, args, config);
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    status = eafkit::cli::kExitUsage;
  } catch (const std::exception& e) {
    const ExitStatus exit_status = eafkit::cli::ToExitStatus(e);
    if (const auto* error = dynamic_cast<const eafkit::util::EafError*>(&e)) {
      EAFKIT_LOG_ERROR("command failed", {StringField("command", cmd), StringField("code", eafkit::util::ToString(error->code())),
                                          StringField("error", e.what())});
    } else {
      EAFKIT_LOG_ERROR("command failed", {StringField("command", cmd), StringField("error", e.what())});
    }
    status = exit_status;
  }

  eafkit::observability::ShutdownLogging();
  return status;
}
