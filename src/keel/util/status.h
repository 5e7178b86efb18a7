// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.
//
// A Status encapsulates the result of an operation.  It may indicate success,
// or it may indicate an error with an associated error message.
//
// Multiple threads can invoke const methods on a Status without
// external synchronization, but if any of the threads may call a
// non-const method, all threads accessing the same Status must use
// external synchronization.
#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <glog/logging.h>

#include "keel/util/macros.h"

// Return the given status if it is not OK.
#define RETURN_NOT_OK(s) do { \
    const ::keel::Status& _s = (s); \
    if (PREDICT_FALSE(!_s.ok())) return _s; \
  } while (0)

// Return the given status if it is not OK, but first clone it and
// prepend the given message.
#define RETURN_NOT_OK_PREPEND(s, msg) do { \
    const ::keel::Status& _s = (s); \
    if (PREDICT_FALSE(!_s.ok())) return _s.CloneAndPrepend(msg); \
  } while (0)

// Emit a warning if 'to_call' returns a bad status.
#define WARN_NOT_OK(to_call, warning_prefix) do { \
    const ::keel::Status& _s = (to_call); \
    if (PREDICT_FALSE(!_s.ok())) { \
      LOG(WARNING) << (warning_prefix) << ": " << _s.ToString(); \
    } \
  } while (0)

#define CHECK_OK_PREPEND(to_call, msg) do { \
    const ::keel::Status& _s = (to_call); \
    CHECK(_s.ok()) << (msg) << ": " << _s.ToString(); \
  } while (0)

// If the status is bad, CHECK immediately, appending the status to the
// logged message.
#define CHECK_OK(s) CHECK_OK_PREPEND(s, "Bad status")

namespace keel {

class Status {
 public:
  // Create a success status.
  Status() = default;
  ~Status() = default;

  Status(const Status& s);
  Status& operator=(const Status& s);
  Status(Status&& s) noexcept = default;
  Status& operator=(Status&& s) noexcept = default;

  // Return a success status.
  static Status OK() { return Status(); }

  // Return error status of an appropriate type.
  static Status NotFound(const std::string& msg, const std::string& msg2 = "",
                         int16_t posix_code = -1) {
    return Status(kNotFound, msg, msg2, posix_code);
  }
  static Status Corruption(const std::string& msg, const std::string& msg2 = "",
                           int16_t posix_code = -1) {
    return Status(kCorruption, msg, msg2, posix_code);
  }
  static Status NotSupported(const std::string& msg, const std::string& msg2 = "",
                             int16_t posix_code = -1) {
    return Status(kNotSupported, msg, msg2, posix_code);
  }
  static Status InvalidArgument(const std::string& msg, const std::string& msg2 = "",
                                int16_t posix_code = -1) {
    return Status(kInvalidArgument, msg, msg2, posix_code);
  }
  static Status IOError(const std::string& msg, const std::string& msg2 = "",
                        int16_t posix_code = -1) {
    return Status(kIOError, msg, msg2, posix_code);
  }
  static Status AlreadyPresent(const std::string& msg, const std::string& msg2 = "",
                               int16_t posix_code = -1) {
    return Status(kAlreadyPresent, msg, msg2, posix_code);
  }
  static Status RuntimeError(const std::string& msg, const std::string& msg2 = "",
                             int16_t posix_code = -1) {
    return Status(kRuntimeError, msg, msg2, posix_code);
  }
  static Status NetworkError(const std::string& msg, const std::string& msg2 = "",
                             int16_t posix_code = -1) {
    return Status(kNetworkError, msg, msg2, posix_code);
  }
  static Status IllegalState(const std::string& msg, const std::string& msg2 = "",
                             int16_t posix_code = -1) {
    return Status(kIllegalState, msg, msg2, posix_code);
  }
  static Status ServiceUnavailable(const std::string& msg, const std::string& msg2 = "",
                                   int16_t posix_code = -1) {
    return Status(kServiceUnavailable, msg, msg2, posix_code);
  }
  static Status TimedOut(const std::string& msg, const std::string& msg2 = "",
                         int16_t posix_code = -1) {
    return Status(kTimedOut, msg, msg2, posix_code);
  }
  static Status Uninitialized(const std::string& msg, const std::string& msg2 = "",
                              int16_t posix_code = -1) {
    return Status(kUninitialized, msg, msg2, posix_code);
  }
  static Status Aborted(const std::string& msg, const std::string& msg2 = "",
                        int16_t posix_code = -1) {
    return Status(kAborted, msg, msg2, posix_code);
  }
  static Status RemoteError(const std::string& msg, const std::string& msg2 = "",
                            int16_t posix_code = -1) {
    return Status(kRemoteError, msg, msg2, posix_code);
  }

  // Returns true iff the status indicates success.
  bool ok() const { return state_ == nullptr; }

  bool IsNotFound() const { return code() == kNotFound; }
  bool IsCorruption() const { return code() == kCorruption; }
  bool IsNotSupported() const { return code() == kNotSupported; }
  bool IsInvalidArgument() const { return code() == kInvalidArgument; }
  bool IsIOError() const { return code() == kIOError; }
  bool IsAlreadyPresent() const { return code() == kAlreadyPresent; }
  bool IsRuntimeError() const { return code() == kRuntimeError; }
  bool IsNetworkError() const { return code() == kNetworkError; }
  bool IsIllegalState() const { return code() == kIllegalState; }
  bool IsServiceUnavailable() const { return code() == kServiceUnavailable; }
  bool IsTimedOut() const { return code() == kTimedOut; }
  bool IsUninitialized() const { return code() == kUninitialized; }
  bool IsAborted() const { return code() == kAborted; }
  bool IsRemoteError() const { return code() == kRemoteError; }

  // Return a string representation of this status suitable for printing.
  // Returns the string "OK" for success.
  std::string ToString() const;

  // Return a string representation of the status code, without the message
  // text or posix code information.
  std::string CodeAsString() const;

  // Return the message portion of the Status. For non-OK statuses,
  // this may be empty. For OK statuses, this returns an empty string.
  std::string message() const;

  // Get the POSIX code associated with this Status, or -1 if there is none.
  int16_t posix_code() const;

  // Return a new Status object with the same state plus an additional leading
  // message.
  Status CloneAndPrepend(const std::string& msg) const;

  // Same as CloneAndPrepend, but appends to the message instead.
  Status CloneAndAppend(const std::string& msg) const;

 private:
  enum Code {
    kOk = 0,
    kNotFound = 1,
    kCorruption = 2,
    kNotSupported = 3,
    kInvalidArgument = 4,
    kIOError = 5,
    kAlreadyPresent = 6,
    kRuntimeError = 7,
    kNetworkError = 8,
    kIllegalState = 9,
    kServiceUnavailable = 10,
    kTimedOut = 11,
    kUninitialized = 12,
    kAborted = 13,
    kRemoteError = 14,
  };

  struct State {
    Code code;
    int16_t posix_code;
    std::string msg;
  };

  Status(Code code, const std::string& msg, const std::string& msg2,
         int16_t posix_code);

  Code code() const {
    return state_ == nullptr ? kOk : state_->code;
  }

  // OK status has a null state_.
  std::unique_ptr<State> state_;
};

inline Status::Status(const Status& s)
    : state_(s.state_ ? new State(*s.state_) : nullptr) {
}

inline Status& Status::operator=(const Status& s) {
  if (this != &s) {
    state_.reset(s.state_ ? new State(*s.state_) : nullptr);
  }
  return *this;
}

} // namespace keel
