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
// Wall-clock helpers. Durable records carry wall-clock timestamps because
// they outlive the process (and its monotonic clock).
#pragma once

#include <cstdint>
#include <string>

namespace keel {

// Microseconds since the Unix epoch.
int64_t GetCurrentTimeMicros();

// Format 'micros_since_epoch' as an ISO-8601 UTC timestamp with microsecond
// precision, e.g. "2024-01-31T08:15:02.000123Z". Returns "<none>" for
// non-positive values.
std::string TimestampToString(int64_t micros_since_epoch);

} // namespace keel
