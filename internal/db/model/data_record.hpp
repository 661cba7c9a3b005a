#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/document.hpp"

namespace flowlog::db::model {

/*
  One immutable unit of flow history ("FlowData").

  cursor is the 1-based position inside the flow; the k-th appended record
  carries cursor k. version is the flow version produced by the append that
  wrote the record, returned again when the same command_id is replayed.
*/

struct DataRecord {
  std::string id;      // UUID text, independent of position
  std::string flow_id;

  int64_t cursor = 0;

  // free-form classification, e.g. "step_state:fetch"
  std::string key;

  flowlog::model::Document payload;
  flowlog::model::Document metadata;

  // idempotency token, unique per flow
  std::optional<std::string> command_id;

  int64_t version = 0;

  uint64_t created_at_ms = 0;
};

} // namespace flowlog::db::model
