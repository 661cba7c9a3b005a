#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/data_record.hpp"

namespace flowlog::core {

/*
  RecordStream

  Lazy, restartable view over the records of one flow with
  cursor > from_cursor.

  - Pages are fetched on demand, each in its own short transaction, so
    appenders are never blocked for the life of a stream.
  - The upper bound is the flow cursor observed by the first fetch; the
    stream is finite even while appends continue.
  - Reset() rewinds and observes a fresh upper bound.
  - An unknown flow yields an empty stream.
  - The record at the upper bound anchors the stream. If a later page no
    longer finds it (the flow was pruned below the bound or deleted),
    Next() throws util::InvalidState rather than mix records from before
    and after the prune. Reset() and read again.
*/
class RecordStream {
 public:
  static constexpr uint64_t kDefaultPageSize = 256;

  RecordStream(std::shared_ptr<db::Repository> repository, std::string flow_id, int64_t from_cursor,
               uint64_t page_size = kDefaultPageSize);

  // Next record, or nullopt once exhausted.
  std::optional<db::model::DataRecord> Next();

  void Reset();

  // Drains the remaining records.
  std::vector<db::model::DataRecord> Collect();

  const std::string& flow_id() const {
    return flow_id_;
  }

  int64_t from_cursor() const {
    return from_cursor_;
  }

 private:
  void FetchPage();
  void CheckAnchor(db::Transaction& tx);

  std::shared_ptr<db::Repository> repository_;
  std::string                     flow_id_;
  int64_t                         from_cursor_;
  uint64_t                        page_size_;

  std::optional<int64_t>             until_cursor_;
  std::optional<std::string>         anchor_id_; // record id at until_cursor_
  int64_t                            last_cursor_;
  std::vector<db::model::DataRecord> page_;
  std::size_t                        page_pos_  = 0;
  bool                               exhausted_ = false;
};

} // namespace flowlog::core
