#include "record_stream.hpp"

#include "internal/util/errors.hpp"

namespace flowlog::core {

RecordStream::RecordStream(std::shared_ptr<db::Repository> repository, std::string flow_id, int64_t from_cursor, uint64_t page_size)
    : repository_(std::move(repository)),
      flow_id_(std::move(flow_id)),
      from_cursor_(from_cursor),
      page_size_(page_size == 0 ? kDefaultPageSize : page_size),
      last_cursor_(from_cursor) {
}

void RecordStream::FetchPage() {
  page_.clear();
  page_pos_ = 0;

  auto tx = repository_->BeginRead();
  const bool first = !until_cursor_;
  if (first) {
    auto flow = repository_->GetFlow(*tx, flow_id_);
    if (!flow) {
      tx->Commit();
      exhausted_ = true;
      return;
    }
    until_cursor_ = flow->cursor;
  }

  page_ = repository_->ReadData(*tx, flow_id_, last_cursor_, until_cursor_, page_size_);
  if (first) {
    auto at_bound = repository_->ReadData(*tx, flow_id_, *until_cursor_ - 1, until_cursor_, 1);
    if (!at_bound.empty()) anchor_id_ = at_bound.front().id;
  } else {
    CheckAnchor(*tx);
  }
  tx->Commit();

  if (page_.size() < page_size_) exhausted_ = true;
  if (!page_.empty()) last_cursor_ = page_.back().cursor;
}

void RecordStream::CheckAnchor(db::Transaction& tx) {
  if (!anchor_id_) return;

  auto at_bound = repository_->ReadData(tx, flow_id_, *until_cursor_ - 1, until_cursor_, 1);
  if (at_bound.empty() || at_bound.front().id != *anchor_id_) {
    page_.clear();
    throw util::InvalidState("record stream: flow " + flow_id_ + " was pruned or deleted at or below cursor " +
                             std::to_string(*until_cursor_));
  }
}

std::optional<db::model::DataRecord> RecordStream::Next() {
  if (page_pos_ >= page_.size()) {
    if (exhausted_) return std::nullopt;
    FetchPage();
    if (page_.empty()) return std::nullopt;
  }
  return page_[page_pos_++];
}

void RecordStream::Reset() {
  until_cursor_.reset();
  anchor_id_.reset();
  last_cursor_ = from_cursor_;
  page_.clear();
  page_pos_  = 0;
  exhausted_ = false;
}

std::vector<db::model::DataRecord> RecordStream::Collect() {
  std::vector<db::model::DataRecord> out;
  while (auto record = Next()) {
    out.push_back(std::move(*record));
  }
  return out;
}

} // namespace flowlog::core
