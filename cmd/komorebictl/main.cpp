#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/manifest/key_set_codec.hpp"
#include "internal/model/metadata_family.hpp"
#include "internal/observability/logging.hpp"
#include "internal/revision/revision.hpp"
#include "internal/revision/revision_delete.hpp"
#include "internal/util/bytes.hpp"
#include "internal/util/errors.hpp"
#include "komorebi/v1.hpp"

using komorebi::model::Component;
using komorebi::model::Mutation;
using komorebi::model::View;
using komorebi::observability::BoolField;
using komorebi::observability::IntField;
using komorebi::observability::StringField;
using komorebi::runtime::config::OUTPUT_FORMAT_JSON;
using komorebi::runtime::config::RuntimeConfig;
using komorebi::util::Escape;
using komorebi::util::FromHex;
using komorebi::util::ToHex;

static void Usage() {
  std::cout << "Usage:\n"
            << "  komorebictl [--config <file.yaml>] write <document.json> [timestamp_ms]\n"
            << "  komorebictl [--config <file.yaml>] delete <manifest_hex>... [--timestamp <ms>]\n"
            << "  komorebictl [--config <file.yaml>] decode <manifest_hex>\n";
}

static int64_t ParseTimestamp(const std::string& value) {
  size_t  consumed = 0;
  int64_t ts       = 0;
  try {
    ts = std::stoll(value, &consumed);
  } catch (const std::exception& e) {
    throw komorebi::util::InvalidArgument("invalid timestamp '" + value + "': " + e.what());
  }
  if (consumed != value.size()) {
    throw komorebi::util::InvalidArgument("invalid timestamp '" + value + "'");
  }
  return ts;
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

static std::optional<std::string> OptionalQualifier(bool has_qualifier, const std::string& qualifier) {
  if (!has_qualifier) {
    return std::nullopt;
  }
  return qualifier;
}

static std::vector<Component> ComponentsFromDocument(const komorebi::v1::Document& document) {
  std::vector<Component> components;
  components.reserve(document.components_size());

  for (const auto& spec : document.components()) {
    std::vector<View> views;
    views.reserve(spec.views_size());
    for (const auto& view : spec.views()) {
      views.emplace_back(view.lookup_term(),
                         OptionalQualifier(view.has_qualifier(), view.qualifier()),
                         view.visibility(),
                         view.value(),
                         view.family());
    }

    components.emplace_back(spec.doc_id(),
                            spec.component_type(),
                            OptionalQualifier(spec.has_qualifier(), spec.qualifier()),
                            spec.visibility(),
                            spec.content(),
                            std::move(views));
  }
  return components;
}

static void PrintMutation(const Mutation& mutation, const RuntimeConfig& config) {
  if (config.output().format() == OUTPUT_FORMAT_JSON) {
    komorebi::v1::MutationRecord record;
    record.set_row(mutation.row);
    record.set_family(mutation.family);
    record.set_qualifier(mutation.qualifier);
    record.set_visibility(mutation.visibility);
    record.set_timestamp_ms(mutation.timestamp_ms);
    record.set_value(mutation.value);
    record.set_deleted(mutation.deleted);

    std::string json;
    auto        status = google::protobuf::util::MessageToJsonString(record, &json);
    if (!status.ok()) {
      throw std::runtime_error("MutationRecord to JSON failed: " + std::string(status.message()));
    }
    std::cout << json << '\n';
    return;
  }

  std::cout << (mutation.deleted ? "delete" : "put") << " row=" << Escape(mutation.row)
            << " family=" << Escape(mutation.family) << " qualifier=" << Escape(mutation.qualifier)
            << " visibility=" << Escape(mutation.visibility) << " ts=" << mutation.timestamp_ms;

  if (!mutation.deleted) {
    // Manifests are printed as hex so they can be passed back to "delete".
    if (komorebi::model::IsMetadataFamily(mutation.family)) {
      std::cout << " manifest=" << ToHex(mutation.value);
    } else {
      std::cout << " value=" << Escape(mutation.value);
    }
  }
  std::cout << '\n';
}

static int RunWrite(const std::vector<std::string>& args, const RuntimeConfig& config) {
  if (args.empty() || args.size() > 2) {
    Usage();
    return 1;
  }

  komorebi::v1::Document document;
  auto status = google::protobuf::util::JsonStringToMessage(ReadFile(args[0]), &document);
  if (!status.ok()) {
    throw komorebi::util::InvalidArgument("invalid document " + args[0] + ": " + std::string(status.message()));
  }

  std::optional<int64_t> timestamp_ms;
  if (args.size() == 2) {
    timestamp_ms = ParseTimestamp(args[1]);
  }

  komorebi::revision::Revision revision(ComponentsFromDocument(document), timestamp_ms);
  for (const auto& mutation : revision.Mutations()) {
    PrintMutation(mutation, config);
  }

  KOMOREBI_LOG_INFO("Revision written",
                    {StringField("document", args[0]),
                     IntField("components", document.components_size()),
                     IntField("timestamp_ms", revision.timestamp_ms()),
                     BoolField("json", config.output().format() == OUTPUT_FORMAT_JSON)});
  return 0;
}

static int RunDelete(const std::vector<std::string>& args, const RuntimeConfig& config) {
  std::vector<std::string> manifests;
  std::optional<int64_t>   timestamp_ms;

  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--timestamp") {
      if (i + 1 == args.size()) {
        Usage();
        return 1;
      }
      timestamp_ms = ParseTimestamp(args[++i]);
      continue;
    }
    manifests.push_back(FromHex(args[i]));
  }

  if (manifests.empty()) {
    Usage();
    return 1;
  }

  komorebi::revision::RevisionDelete revision(std::move(manifests), timestamp_ms);
  for (const auto& mutation : revision.Mutations()) {
    PrintMutation(mutation, config);
  }

  KOMOREBI_LOG_INFO("Revision delete written",
                    {IntField("manifests", static_cast<int64_t>(revision.encoded_key_sets().size())),
                     IntField("timestamp_ms", revision.timestamp_ms()),
                     BoolField("json", config.output().format() == OUTPUT_FORMAT_JSON)});
  return 0;
}

static int RunDecode(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    Usage();
    return 1;
  }

  for (const auto& key : komorebi::manifest::DecodeKeySet(FromHex(args[0]))) {
    std::cout << "row=" << Escape(key.row) << " family=" << Escape(key.family)
              << " qualifier=" << Escape(key.qualifier) << " visibility=" << Escape(key.visibility) << '\n';
  }
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string        cmd = args[0];
  std::vector<std::string> rest(args.begin() + 1, args.end());

  try {
    auto config = config_path.empty() ? komorebi::config::ConfigLoader::Defaults()
                                      : komorebi::config::ConfigLoader::LoadFromYaml(config_path);
    komorebi::observability::InitializeLogging(config);

    int rc = 1;
    if (cmd == "write") {
      rc = RunWrite(rest, config);
    } else if (cmd == "delete") {
      rc = RunDelete(rest, config);
    } else if (cmd == "decode") {
      rc = RunDecode(rest);
    } else {
      Usage();
    }

    komorebi::observability::ShutdownLogging();
    return rc;
  } catch (const komorebi::util::InvalidArgument& e) {
    // Bad command line input (hex, timestamp, document) is a usage error.
    std::cerr << "komorebictl: " << e.what() << '\n';
    Usage();
    komorebi::observability::ShutdownLogging();
    return 1;
  } catch (const std::exception& e) {
    KOMOREBI_LOG_ERROR("Fatal error", {StringField("command", cmd), StringField("error", e.what())});
    komorebi::observability::ShutdownLogging();
    return 2;
  }
}
