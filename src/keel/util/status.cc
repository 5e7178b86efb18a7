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

#include "keel/util/status.h"

#include <cstdio>
#include <string>

using std::string;

namespace keel {

Status::Status(Code code, const string& msg, const string& msg2,
               int16_t posix_code)
    : state_(new State) {
  DCHECK(code != kOk);
  state_->code = code;
  state_->posix_code = posix_code;
  state_->msg = msg;
  if (!msg2.empty()) {
    state_->msg.append(": ");
    state_->msg.append(msg2);
  }
}

string Status::CodeAsString() const {
  if (state_ == nullptr) {
    return "OK";
  }

  const char* type;
  switch (code()) {
    case kOk:
      type = "OK";
      break;
    case kNotFound:
      type = "Not found";
      break;
    case kCorruption:
      type = "Corruption";
      break;
    case kNotSupported:
      type = "Not implemented";
      break;
    case kInvalidArgument:
      type = "Invalid argument";
      break;
    case kIOError:
      type = "IO error";
      break;
    case kAlreadyPresent:
      type = "Already present";
      break;
    case kRuntimeError:
      type = "Runtime error";
      break;
    case kNetworkError:
      type = "Network error";
      break;
    case kIllegalState:
      type = "Illegal state";
      break;
    case kServiceUnavailable:
      type = "Service unavailable";
      break;
    case kTimedOut:
      type = "Timed out";
      break;
    case kUninitialized:
      type = "Uninitialized";
      break;
    case kAborted:
      type = "Aborted";
      break;
    case kRemoteError:
      type = "Remote error";
      break;
    default: {
      char tmp[30];
      snprintf(tmp, sizeof(tmp), "Unknown code(%d)", static_cast<int>(code()));
      return string(tmp);
    }
  }
  return string(type);
}

string Status::ToString() const {
  string result(CodeAsString());
  if (state_ == nullptr) {
    return result;
  }

  result.append(": ");
  result.append(state_->msg);
  if (state_->posix_code != -1) {
    char buf[64];
    snprintf(buf, sizeof(buf), " (error %d)", state_->posix_code);
    result.append(buf);
  }
  return result;
}

string Status::message() const {
  if (state_ == nullptr) {
    return string();
  }
  return state_->msg;
}

int16_t Status::posix_code() const {
  if (state_ == nullptr) {
    return 0;
  }
  return state_->posix_code;
}

Status Status::CloneAndPrepend(const string& msg) const {
  if (ok()) {
    return *this;
  }
  return Status(code(), msg, state_->msg, state_->posix_code);
}

Status Status::CloneAndAppend(const string& msg) const {
  if (ok()) {
    return *this;
  }
  return Status(code(), state_->msg, msg, state_->posix_code);
}

} // namespace keel
