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

#include "keel/util/monotime.h"

#include <cerrno>
#include <ctime>
#include <limits>

#include <absl/strings/str_format.h>
#include <glog/logging.h>

namespace keel {

const int64_t MonoDelta::kUninitialized = std::numeric_limits<int64_t>::min();

const int64_t MonoTime::kNanosecondsPerSecond = 1000000000L;
const int64_t MonoTime::kNanosecondsPerMillisecond = 1000000L;
const int64_t MonoTime::kNanosecondsPerMicrosecond = 1000L;
const int64_t MonoTime::kMicrosecondsPerSecond = 1000000L;

MonoDelta MonoDelta::FromSeconds(double seconds) {
  int64_t delta = static_cast<int64_t>(seconds * MonoTime::kNanosecondsPerSecond);
  return MonoDelta(delta);
}

MonoDelta MonoDelta::FromMilliseconds(int64_t ms) {
  return MonoDelta(ms * MonoTime::kNanosecondsPerMillisecond);
}

MonoDelta MonoDelta::FromMicroseconds(int64_t us) {
  return MonoDelta(us * MonoTime::kNanosecondsPerMicrosecond);
}

MonoDelta MonoDelta::FromNanoseconds(int64_t ns) {
  return MonoDelta(ns);
}

MonoDelta::MonoDelta()
    : nano_delta_(kUninitialized) {
}

bool MonoDelta::Initialized() const {
  return nano_delta_ != kUninitialized;
}

bool MonoDelta::LessThan(const MonoDelta& rhs) const {
  DCHECK(Initialized());
  DCHECK(rhs.Initialized());
  return nano_delta_ < rhs.nano_delta_;
}

bool MonoDelta::MoreThan(const MonoDelta& rhs) const {
  DCHECK(Initialized());
  DCHECK(rhs.Initialized());
  return nano_delta_ > rhs.nano_delta_;
}

bool MonoDelta::Equals(const MonoDelta& rhs) const {
  DCHECK(Initialized());
  DCHECK(rhs.Initialized());
  return nano_delta_ == rhs.nano_delta_;
}

std::string MonoDelta::ToString() const {
  return absl::StrFormat("%.3fs", ToSeconds());
}

MonoDelta::MonoDelta(int64_t delta)
    : nano_delta_(delta) {
}

double MonoDelta::ToSeconds() const {
  DCHECK(Initialized());
  double d(nano_delta_);
  d /= MonoTime::kNanosecondsPerSecond;
  return d;
}

int64_t MonoDelta::ToNanoseconds() const {
  DCHECK(Initialized());
  return nano_delta_;
}

int64_t MonoDelta::ToMicroseconds() const {
  DCHECK(Initialized());
  return nano_delta_ / MonoTime::kNanosecondsPerMicrosecond;
}

int64_t MonoDelta::ToMilliseconds() const {
  DCHECK(Initialized());
  return nano_delta_ / MonoTime::kNanosecondsPerMillisecond;
}

MonoDelta& MonoDelta::operator+=(const MonoDelta& delta) {
  nano_delta_ += delta.nano_delta_;
  return *this;
}

MonoDelta& MonoDelta::operator-=(const MonoDelta& delta) {
  nano_delta_ -= delta.nano_delta_;
  return *this;
}

MonoTime MonoTime::Now() {
  struct timespec ts;
  PCHECK(clock_gettime(CLOCK_MONOTONIC, &ts) == 0);
  return MonoTime(ts.tv_sec * kNanosecondsPerSecond + ts.tv_nsec);
}

MonoTime MonoTime::Max() {
  return MonoTime(std::numeric_limits<int64_t>::max());
}

MonoTime MonoTime::Min() {
  return MonoTime(1);
}

const MonoTime& MonoTime::Earliest(const MonoTime& a, const MonoTime& b) {
  if (b.nanos_ < a.nanos_) {
    return b;
  }
  return a;
}

MonoTime::MonoTime()
    : nanos_(0) {
}

bool MonoTime::Initialized() const {
  return nanos_ != 0;
}

MonoDelta MonoTime::GetDeltaSince(const MonoTime& rhs) const {
  DCHECK(Initialized());
  DCHECK(rhs.Initialized());
  return MonoDelta(nanos_ - rhs.nanos_);
}

void MonoTime::AddDelta(const MonoDelta& delta) {
  DCHECK(Initialized());
  DCHECK(delta.Initialized());
  // Saturate instead of overflowing when adding to Max().
  if (delta.nano_delta_ > 0 &&
      nanos_ > std::numeric_limits<int64_t>::max() - delta.nano_delta_) {
    nanos_ = std::numeric_limits<int64_t>::max();
    return;
  }
  nanos_ += delta.nano_delta_;
}

bool MonoTime::ComesBefore(const MonoTime& rhs) const {
  DCHECK(Initialized());
  DCHECK(rhs.Initialized());
  return nanos_ < rhs.nanos_;
}

std::string MonoTime::ToString() const {
  return absl::StrFormat("%.3fs", ToSeconds());
}

bool MonoTime::Equals(const MonoTime& other) const {
  return nanos_ == other.nanos_;
}

MonoTime& MonoTime::operator+=(const MonoDelta& delta) {
  AddDelta(delta);
  return *this;
}

MonoTime& MonoTime::operator-=(const MonoDelta& delta) {
  AddDelta(MonoDelta(-1 * delta.nano_delta_));
  return *this;
}

MonoTime::MonoTime(int64_t nanos)
    : nanos_(nanos) {
}

double MonoTime::ToSeconds() const {
  double d(nanos_);
  d /= kNanosecondsPerSecond;
  return d;
}

void SleepFor(const MonoDelta& delta) {
  if (delta.ToNanoseconds() <= 0) {
    return;
  }
  struct timespec ts;
  ts.tv_sec = delta.ToNanoseconds() / MonoTime::kNanosecondsPerSecond;
  ts.tv_nsec = delta.ToNanoseconds() % MonoTime::kNanosecondsPerSecond;
  while (nanosleep(&ts, &ts) == -1 && errno == EINTR) {
  }
}

bool operator==(const MonoDelta& lhs, const MonoDelta& rhs) {
  return lhs.Equals(rhs);
}

bool operator!=(const MonoDelta& lhs, const MonoDelta& rhs) {
  return !lhs.Equals(rhs);
}

bool operator<(const MonoDelta& lhs, const MonoDelta& rhs) {
  return lhs.LessThan(rhs);
}

bool operator<=(const MonoDelta& lhs, const MonoDelta& rhs) {
  return lhs.LessThan(rhs) || lhs.Equals(rhs);
}

bool operator>(const MonoDelta& lhs, const MonoDelta& rhs) {
  return lhs.MoreThan(rhs);
}

bool operator>=(const MonoDelta& lhs, const MonoDelta& rhs) {
  return lhs.MoreThan(rhs) || lhs.Equals(rhs);
}

bool operator==(const MonoTime& lhs, const MonoTime& rhs) {
  return lhs.Equals(rhs);
}

bool operator!=(const MonoTime& lhs, const MonoTime& rhs) {
  return !lhs.Equals(rhs);
}

bool operator<(const MonoTime& lhs, const MonoTime& rhs) {
  return lhs.ComesBefore(rhs);
}

bool operator<=(const MonoTime& lhs, const MonoTime& rhs) {
  return lhs.ComesBefore(rhs) || lhs.Equals(rhs);
}

bool operator>(const MonoTime& lhs, const MonoTime& rhs) {
  return rhs.ComesBefore(lhs);
}

bool operator>=(const MonoTime& lhs, const MonoTime& rhs) {
  return rhs.ComesBefore(lhs) || rhs.Equals(lhs);
}

MonoTime operator+(const MonoTime& t, const MonoDelta& delta) {
  MonoTime tmp(t);
  tmp.AddDelta(delta);
  return tmp;
}

MonoTime operator-(const MonoTime& t, const MonoDelta& delta) {
  MonoTime tmp(t);
  tmp -= delta;
  return tmp;
}

MonoDelta operator-(const MonoTime& t_end, const MonoTime& t_begin) {
  return t_end.GetDeltaSince(t_begin);
}

} // namespace keel
