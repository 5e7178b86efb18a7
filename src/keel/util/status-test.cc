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

#include <cerrno>
#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "keel/util/test_macros.h"

using std::string;

namespace keel {

TEST(StatusTest, TestPosixCode) {
  Status ok = Status::OK();
  ASSERT_EQ(0, ok.posix_code());
  Status file_error = Status::IOError("file error", "", ENOTDIR);
  ASSERT_EQ(ENOTDIR, file_error.posix_code());
}

TEST(StatusTest, TestToString) {
  Status file_error = Status::IOError("file error", "", ENOTDIR);
  ASSERT_EQ(string("IO error: file error (error 20)"), file_error.ToString());
  ASSERT_EQ("OK", Status::OK().ToString());
  ASSERT_EQ("Not found: transaction abc", Status::NotFound("transaction", "abc").ToString());
}

TEST(StatusTest, TestClonePrepend) {
  Status file_error = Status::IOError("file error", "msg2", ENOTDIR);
  Status appended = file_error.CloneAndPrepend("Heading");
  ASSERT_EQ(string("IO error: Heading: file error: msg2 (error 20)"), appended.ToString());
}

TEST(StatusTest, TestCloneAppend) {
  Status remote = Status::RemoteError("payment", "declined");
  Status appended = remote.CloneAndAppend("attempt 3");
  ASSERT_TRUE(appended.IsRemoteError());
  ASSERT_EQ("payment: declined: attempt 3", appended.message());
}

TEST(StatusTest, TestCopyAndMove) {
  Status orig = Status::TimedOut("step timed out");
  Status copy(orig);
  ASSERT_TRUE(copy.IsTimedOut());
  ASSERT_EQ(orig.ToString(), copy.ToString());

  Status moved(std::move(copy));
  ASSERT_TRUE(moved.IsTimedOut());

  Status assigned;
  ASSERT_TRUE(assigned.ok());
  assigned = moved;
  ASSERT_EQ("Timed out", assigned.CodeAsString());
}

static Status FailsThenPrepends() {
  RETURN_NOT_OK_PREPEND(Status::Corruption("bad record"), "loading txn");
  return Status::OK();
}

TEST(StatusTest, TestReturnNotOkPrepend) {
  Status s = FailsThenPrepends();
  ASSERT_TRUE(s.IsCorruption());
  ASSERT_STR_CONTAINS(s.ToString(), "loading txn: bad record");
}

} // namespace keel
