#pragma once

#include <stdexcept>
#include <string>

namespace medsync::util {

/*
  Central error types for API misuse.

  Transfer failures are not exceptions; they travel as model::TransferError
  values so the engine can route them (retry, restart, pause, drop).
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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidPayload : public std::runtime_error {
 public:
  explicit InvalidPayload(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace medsync::util
