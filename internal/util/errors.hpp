#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace relcache::util {

/*
  Central error types.

  Every client operation fails with one of these; callers tell
  them apart by type (or Cmder::IsNotFound on the adapter).
*/

// No default client registered.
class NotInitialized : public std::runtime_error {
 public:
  explicit NotInitialized(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Key, field or entry absent (or expired).
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Bad argument: negative ttl, odd HSet pairs, non-integer counter value.
class ValidationError : public std::invalid_argument {
 public:
  explicit ValidationError(const std::string& msg) : std::invalid_argument(msg) {
  }
};

// Underlying store failed (connection, lock timeout, constraint...).
class StoreError : public std::runtime_error {
 public:
  StoreError(db::ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  db::ErrorCode code() const {
    return code_;
  }

  // lock contention and serialization failures may succeed on retry
  bool Retryable() const {
    return code_ == db::ErrorCode::Busy || code_ == db::ErrorCode::SerializationFailure;
  }

 private:
  db::ErrorCode code_;
};

} // namespace relcache::util
