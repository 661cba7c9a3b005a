#pragma once

#include <stdexcept>
#include <string>

namespace flowlog::util {

/*
  Central error types.

  Backends report db::Result codes; core::ThrowIfDbError maps them here.
  Version conflicts are not errors (see core::PersistOutcome).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The data an operation was reading changed underneath it (e.g. a flow
// pruned while a stream was open). Safe to retry from the start.
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backend unavailable, constraint violation, corruption. Never auto-retried.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Operation intentionally unsupported by the configured backend or store.
class NotImplemented : public std::runtime_error {
 public:
  explicit NotImplemented(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace flowlog::util
