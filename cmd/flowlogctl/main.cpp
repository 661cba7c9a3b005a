#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "flowlog/v1.hpp"

using flowlog::model::Document;

static void Usage() {
  std::cout << "Usage:\n"
            << "  flowlogctl [--config <file.yaml>] create [name] [status] [metadata_json]\n"
            << "  flowlogctl [--config <file.yaml>] meta <flow_id>\n"
            << "  flowlogctl [--config <file.yaml>] append <flow_id> <expected_version> <key> <payload_json> [command_id] [metadata_json]\n"
            << "  flowlogctl [--config <file.yaml>] read <flow_id> [from_cursor]\n"
            << "  flowlogctl [--config <file.yaml>] branch <parent_flow_id> <parent_cursor> [name]\n"
            << "  flowlogctl [--config <file.yaml>] delete <flow_id>\n"
            << "  flowlogctl [--config <file.yaml>] prune <flow_id> <from_cursor>\n"
            << "  flowlogctl [--config <file.yaml>] count <flow_id>\n"
            << "  flowlogctl [--config <file.yaml>] status <flow_id> [new_status]\n"
            << "  flowlogctl [--config <file.yaml>] snapshot-latest <flow_id>\n"
            << "\n"
            << "Exit codes: 0 ok, 1 usage, 2 failure, 3 conflict\n";
}

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitUsage    = 1;
constexpr int kExitFailure  = 2;
constexpr int kExitConflict = 3;

// Thrown for malformed command lines; maps to exit code 1.
struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

int64_t ParseInt(const std::string& value, const char* what) {
  std::size_t pos = 0;
  int64_t     parsed;
  try {
    parsed = std::stoll(value, &pos);
  } catch (const std::logic_error&) {
    throw UsageError(std::string("invalid ") + what + ": " + value);
  }
  if (pos != value.size()) throw UsageError(std::string("invalid ") + what + ": " + value);
  return parsed;
}

Document ParseJson(const std::string& value, const char* what) {
  try {
    return flowlog::model::FromJson(value);
  } catch (const flowlog::util::InvalidArgument& e) {
    throw UsageError(std::string("invalid ") + what + " json: " + e.what());
  }
}

Document OptionalText(const std::optional<std::string>& value) {
  return value ? Document(*value) : Document();
}

Document OptionalInt(const std::optional<int64_t>& value) {
  return value ? Document(*value) : Document();
}

Document FlowToDocument(const flowlog::core::FlowMeta& flow) {
  return Document::MakeObject({
      {"id", flow.id},
      {"name", OptionalText(flow.name)},
      {"status", OptionalText(flow.status)},
      {"created_by", OptionalText(flow.created_by)},
      {"created_at_ms", static_cast<int64_t>(flow.created_at_ms)},
      {"cursor", flow.cursor},
      {"version", flow.version},
      {"parent_flow_id", OptionalText(flow.parent_flow_id)},
      {"parent_cursor", OptionalInt(flow.parent_cursor)},
      {"metadata", flow.metadata},
  });
}

Document RecordToDocument(const flowlog::db::model::DataRecord& record) {
  return Document::MakeObject({
      {"id", record.id},
      {"cursor", record.cursor},
      {"key", record.key},
      {"payload", record.payload},
      {"metadata", record.metadata},
      {"command_id", OptionalText(record.command_id)},
      {"version", record.version},
      {"created_at_ms", static_cast<int64_t>(record.created_at_ms)},
  });
}

Document SnapshotToDocument(const flowlog::db::model::SnapshotRecord& snapshot) {
  return Document::MakeObject({
      {"id", snapshot.id},
      {"flow_id", snapshot.flow_id},
      {"cursor", snapshot.cursor},
      {"state_ptr", snapshot.state_ptr},
      {"metadata", snapshot.metadata},
      {"created_at_ms", static_cast<int64_t>(snapshot.created_at_ms)},
  });
}

void Print(const Document& doc) {
  std::cout << flowlog::model::ToJson(doc) << "\n";
}

int Run(flowlog::core::FlowStore& flows, const std::string& cmd, int argc, char** argv, int first) {
  auto arg = [&](int i) -> std::optional<std::string> {
    if (first + i < argc) return std::string(argv[first + i]);
    return std::nullopt;
  };
  auto required = [&](int i, const char* what) {
    auto value = arg(i);
    if (!value) throw UsageError(std::string("missing ") + what);
    return *value;
  };

  // ------------------------------------------------------------

  if (cmd == "create") {
    flowlog::core::FlowSpec spec;
    spec.name   = arg(0);
    spec.status = arg(1);
    if (auto metadata = arg(2)) spec.metadata = ParseJson(*metadata, "metadata");

    std::cout << flows.CreateFlow(spec) << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "meta") {
    Print(FlowToDocument(flows.GetFlowMeta(required(0, "flow_id"))));
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "append") {
    flowlog::core::NewRecord record;
    record.flow_id               = required(0, "flow_id");
    const auto expected_version  = ParseInt(required(1, "expected_version"), "expected_version");
    record.key                   = required(2, "key");
    record.payload               = ParseJson(required(3, "payload_json"), "payload");
    record.command_id            = arg(4);
    if (auto metadata = arg(5)) record.metadata = ParseJson(*metadata, "metadata");

    auto outcome = flows.Append(record, expected_version);
    if (!outcome.ok()) {
      std::cerr << "conflict: current version " << outcome.version << "\n";
      return kExitConflict;
    }
    std::cout << "version=" << outcome.version << (outcome.replayed ? " replayed" : "") << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "read") {
    const auto flow_id = required(0, "flow_id");
    const auto from    = arg(1) ? ParseInt(*arg(1), "from_cursor") : 0;

    auto stream = flows.ReadRecords(flow_id, from);
    while (auto record = stream.Next()) {
      Print(RecordToDocument(*record));
    }
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "branch") {
    flowlog::core::BranchSpec spec;
    spec.parent_flow_id = required(0, "parent_flow_id");
    spec.parent_cursor  = ParseInt(required(1, "parent_cursor"), "parent_cursor");
    spec.name           = arg(2);

    std::cout << flows.Branch(spec) << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    flows.DeleteFlow(required(0, "flow_id"));
    std::cout << "deleted\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "prune") {
    const auto flow_id = required(0, "flow_id");
    const auto from    = ParseInt(required(1, "from_cursor"), "from_cursor");

    std::cout << "removed=" << flows.PruneFrom(flow_id, from) << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "count") {
    std::cout << flows.CountRecords(required(0, "flow_id")) << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    const auto flow_id = required(0, "flow_id");
    if (auto status = arg(1)) {
      flows.SetStatus(flow_id, *status);
    }
    std::cout << flows.GetStatus(flow_id).value_or("") << "\n";
    return kExitOk;
  }

  // ------------------------------------------------------------

  if (cmd == "snapshot-latest") {
    auto snapshot = flows.LoadLatestSnapshot(required(0, "flow_id"));
    Print(snapshot ? SnapshotToDocument(*snapshot) : Document());
    return kExitOk;
  }

  throw UsageError("unknown command: " + cmd);
}

} // namespace

int main(int argc, char** argv) {
  int                        next = 1;
  std::optional<std::string> config_path;

  if (argc > 2 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    next        = 3;
  }

  if (next >= argc) {
    Usage();
    return kExitUsage;
  }

  const std::string cmd = argv[next];

  try {
    flowlog::runtime::config::RuntimeConfig config;
    if (config_path) config = flowlog::config::ConfigLoader::LoadFromYaml(*config_path);

    flowlog::observability::InitializeLogging(config);
    auto runtime = flowlog::factory::BuildRuntime(config);

    int rc = Run(*runtime.flows, cmd, argc, argv, next + 1);
    flowlog::observability::ShutdownLogging();
    return rc;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    return kExitUsage;
  } catch (const std::exception& e) {
    FLOWLOG_LOG_ERROR("command failed", {flowlog::observability::StringField("command", cmd), flowlog::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    return kExitFailure;
  }
}
