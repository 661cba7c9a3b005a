#pragma once

#include <cstdint>
#include <string>

#include "internal/model/document.hpp"

namespace flowlog::db::model {

/*
  Point-in-time capture of a flow's reconstructed state.

  state_ptr is opaque to the repository. The rehydration engine writes
  "inline:<state>" or "artifact:<key>".
*/

struct SnapshotRecord {
  std::string id;
  std::string flow_id;

  // state after applying records 1..cursor
  int64_t cursor = 0;

  std::string state_ptr;

  flowlog::model::Document metadata;

  uint64_t created_at_ms = 0;
};

} // namespace flowlog::db::model
