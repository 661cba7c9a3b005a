#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/document.hpp"

namespace flowlog::db::model {

/*
  Persistent lineage ("flow") row.

  IMPORTANT:
  - cursor  == number of data records currently stored for the flow.
  - version is the optimistic concurrency counter; +1 per successful append.
  - parent_* are set only for flows created by branching, and are cleared
    when the parent is deleted or pruned past the branch point (orphaning).
*/

struct FlowRecord {
  std::string id; // UUID text

  std::optional<std::string> name;
  std::optional<std::string> status;
  std::optional<std::string> created_by;

  uint64_t created_at_ms = 0;

  int64_t cursor  = 0;
  int64_t version = 0;

  std::optional<std::string> parent_flow_id;
  std::optional<int64_t>     parent_cursor;

  flowlog::model::Document metadata;
};

} // namespace flowlog::db::model
