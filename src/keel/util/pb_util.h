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
// Utilities for dealing with protocol buffers.
// These are mostly just functions similar to what are found in the protobuf
// library itself, returning keel::Status instead of bool.
#pragma once

#include <cstdint>
#include <string>

#include "keel/util/status.h"

namespace google {
namespace protobuf {
class MessageLite;
} // namespace protobuf
} // namespace google

namespace keel {
namespace pb_util {

using google::protobuf::MessageLite;

// Suffix of the temporary file written by WritePBToPath() before it is
// renamed into place.
extern const char* const kTmpSuffix;

// Similar to MessageLite::ParseFromArray, with the difference that it returns
// Status::Corruption() if the message could not be parsed.
Status ParseFromArray(MessageLite* msg, const uint8_t* data, uint32_t length);

// Similar to MessageLite::SerializeToString, with the difference that it
// returns Status::Corruption() if the message is missing required fields.
Status SerializeToString(const MessageLite& msg, std::string* output);

// Atomically write 'msg' to 'path': the message is serialized into a
// temporary file next to 'path', synced, and renamed over 'path'. If
// 'sync_dir' is true the parent directory is synced as well so the rename
// survives a crash.
Status WritePBToPath(const std::string& path, const MessageLite& msg,
                     bool sync_dir = true);

// Read a message previously written with WritePBToPath(). Returns
// Status::NotFound() if 'path' does not exist.
Status ReadPBFromPath(const std::string& path, MessageLite* msg);

} // namespace pb_util
} // namespace keel
