#pragma once

#include "config/config.pb.h"

#include "internal/config/config_loader.hpp"
#include "internal/core/flow_repository.hpp"
#include "internal/core/flow_store.hpp"
#include "internal/core/rehydration_engine.hpp"
#include "internal/factory.hpp"
#include "internal/model/document.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/util/errors.hpp"

namespace flowlog::v1 {
using ::flowlog::core::BranchSpec;
using ::flowlog::core::ChildPolicy;
using ::flowlog::core::FlowMeta;
using ::flowlog::core::FlowRepository;
using ::flowlog::core::FlowSpec;
using ::flowlog::core::NewRecord;
using ::flowlog::core::PersistOutcome;
using ::flowlog::core::RecordStream;
using ::flowlog::core::Reducer;
using ::flowlog::core::Rehydration;
using ::flowlog::core::RehydrationEngine;
using ::flowlog::model::Document;
}
