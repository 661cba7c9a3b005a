#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/flow_store.hpp"
#include "internal/core/rehydration_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/storage/artifact_store.hpp"

namespace flowlog::factory {

/*
  Runtime

  Owns all long-lived objects of one flowlog instance. The memory
  backend's state lives exactly as long as the repository held here.
*/
struct Runtime {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<core::FlowStore>         flows;
  storage::ArtifactStorePtr                artifacts;
  std::shared_ptr<core::RehydrationEngine> engine;
};

/*
  BuildRuntime

  Constructs the entire stack based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Runtime BuildRuntime(const flowlog::runtime::config::RuntimeConfig& config);

// Backend selected by config.database(); schema is bootstrapped.
std::shared_ptr<db::Repository> BuildRepository(const flowlog::runtime::config::RuntimeConfig& config);

core::ChildPolicy ToChildPolicy(flowlog::runtime::config::ChildPolicy policy);

} // namespace flowlog::factory
