#include <cstdint>
#include <iostream>
#include <string>

#include "flowlog/v1.hpp"

using namespace flowlog::v1;

namespace {

// Toy workflow state: completed steps and the running total of their costs.
struct Progress {
  int64_t steps = 0;
  int64_t total = 0;
};

Reducer<Progress> ProgressReducer() {
  Reducer<Progress> reducer;
  reducer.apply = [](Progress state, const flowlog::db::model::DataRecord& record) {
    state.steps += 1;
    if (const auto* cost = record.payload.Find("cost")) state.total += cost->AsInt();
    return state;
  };
  reducer.encode = [](const Progress& state) {
    return flowlog::model::ToJson(Document::MakeObject({{"steps", state.steps}, {"total", state.total}}));
  };
  reducer.decode = [](const std::string& text) {
    auto     doc = flowlog::model::FromJson(text);
    Progress state;
    state.steps = doc["steps"].AsInt();
    state.total = doc["total"].AsInt();
    return state;
  };
  return reducer;
}

} // namespace

int main(int argc, char** argv) {
  flowlog::runtime::config::RuntimeConfig config;
  if (argc > 1) config = flowlog::config::ConfigLoader::LoadFromYaml(argv[1]);
  config.mutable_snapshots()->set_interval(2);

  flowlog::observability::InitializeLogging(config);
  auto runtime = flowlog::factory::BuildRuntime(config);
  auto reducer = ProgressReducer();

  FlowSpec spec;
  spec.name   = "example";
  spec.status = "running";
  auto flow   = runtime.flows->CreateFlow(spec);

  // Each step is appended against the version we last observed; the engine
  // snapshots every second step.
  int64_t version = 0;
  for (int step = 1; step <= 5; ++step) {
    NewRecord record;
    record.flow_id    = flow;
    record.key        = "step_state:" + std::to_string(step);
    record.payload    = Document::MakeObject({{"cost", step * 10}});
    record.command_id = "step-" + std::to_string(step);

    auto outcome = runtime.engine->AppendRecord(record, version, reducer);
    if (!outcome.ok()) {
      std::cerr << "conflict at step " << step << ", current version " << outcome.version << '\n';
      return 1;
    }
    version = outcome.version;
  }

  auto state = runtime.engine->Rehydrate(flow, reducer);
  std::cout << "flow " << flow << ": steps=" << state.state.steps << " total=" << state.state.total << " cursor=" << state.cursor
            << " replayed=" << state.replayed << '\n';

  // Fork after step 3 and continue the branch independently.
  BranchSpec branch;
  branch.parent_flow_id = flow;
  branch.parent_cursor  = 3;
  branch.name           = "example-retry";
  auto forked           = runtime.flows->Branch(branch);

  auto forked_state = runtime.engine->Rehydrate(forked, reducer);
  std::cout << "branch " << forked << ": steps=" << forked_state.state.steps << " total=" << forked_state.state.total << '\n';

  flowlog::observability::ShutdownLogging();
  return 0;
}
