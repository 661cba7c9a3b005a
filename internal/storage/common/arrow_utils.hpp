#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <memory>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace flowlog::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::StorageError
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw util::StorageError(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::StorageError(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->ReadAt(0, size));
}

// Owning copy of the bytes.
inline std::shared_ptr<arrow::Buffer> ToBuffer(std::string_view bytes) {
  return arrow::Buffer::FromString(std::string(bytes));
}

inline std::string ToString(const arrow::Buffer& buffer) {
  return buffer.ToString();
}

} // namespace flowlog::storage::common
