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

#include "keel/util/wall_clock.h"

#include <sys/time.h>

#include <ctime>

#include <absl/strings/str_format.h>
#include <glog/logging.h>

namespace keel {

int64_t GetCurrentTimeMicros() {
  struct timeval tv;
  PCHECK(gettimeofday(&tv, nullptr) == 0);
  return static_cast<int64_t>(tv.tv_sec) * 1000000 + tv.tv_usec;
}

std::string TimestampToString(int64_t micros_since_epoch) {
  if (micros_since_epoch <= 0) {
    return "<none>";
  }
  time_t secs = static_cast<time_t>(micros_since_epoch / 1000000);
  int64_t usecs = micros_since_epoch % 1000000;
  struct tm tm_utc;
  if (gmtime_r(&secs, &tm_utc) == nullptr) {
    return absl::StrFormat("%d", micros_since_epoch);
  }
  return absl::StrFormat("%04d-%02d-%02dT%02d:%02d:%02d.%06dZ",
                         tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                         tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec, usecs);
}

} // namespace keel
