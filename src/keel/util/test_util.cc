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

#include "keel/util/test_util.h"

#include <ftw.h>
#include <strings.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>

#include <absl/strings/str_replace.h>
#include <absl/strings/substitute.h>
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gtest/gtest-spi.h>

#include "keel/util/errno.h"
#include "keel/util/status.h"
#include "keel/util/test_macros.h"
#include "keel/util/wall_clock.h"

DEFINE_string(test_leave_files, "on_failure",
              "Whether to leave test files around after the test run. "
              " Valid values are 'always', 'on_failure', or 'never'");

DEFINE_int32(test_random_seed, 0, "Random seed to use for randomized tests");

using std::string;

namespace keel {

static const char* const kSlowTestsEnvVar = "KEEL_ALLOW_SLOW_TESTS";

namespace {

Status CreateDirIfMissing(const string& path) {
  if (mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
    return IOErrorFromErrno("Unable to create directory " + path, errno);
  }
  return Status::OK();
}

int RemoveEntry(const char* path, const struct stat* /*sb*/, int /*typeflag*/,
                struct FTW* /*ftwbuf*/) {
  return remove(path);
}

// Removes 'path' and everything below it.
Status DeleteRecursively(const string& path) {
  if (nftw(path.c_str(), RemoveEntry, 64, FTW_DEPTH | FTW_PHYS) != 0) {
    return IOErrorFromErrno("Unable to delete " + path, errno);
  }
  return Status::OK();
}

} // anonymous namespace

///////////////////////////////////////////////////
// KeelTest
///////////////////////////////////////////////////

KeelTest::KeelTest() {
}

KeelTest::~KeelTest() {
  if (test_dir_.empty()) {
    return;
  }
  // Clean up the test directory in the destructor instead of a TearDown
  // method, so that the child-class dtor runs first and any coordinator it
  // owns has been shut down before we remove files underneath it.
  if (FLAGS_test_leave_files == "always") {
    LOG(INFO) << "-----------------------------------------------";
    LOG(INFO) << "--test_leave_files specified, leaving files in " << test_dir_;
  } else if (FLAGS_test_leave_files == "on_failure" && HasFailure()) {
    LOG(INFO) << "-----------------------------------------------";
    LOG(INFO) << "Had failures, leaving test files at " << test_dir_;
  } else {
    VLOG(1) << "Cleaning up temporary test files...";
    WARN_NOT_OK(DeleteRecursively(test_dir_), "Couldn't remove test files");
  }
}

void KeelTest::SetUp() {
  const ::testing::TestInfo* const test_info =
      ::testing::UnitTest::GetInstance()->current_test_info();

  test_dir_ = GetTestDataDirectory() + absl::Substitute(
      "/$0.$1.$2-$3",
      absl::StrReplaceAll(test_info->test_case_name(), {{"/", "_"}}),
      absl::StrReplaceAll(test_info->name(), {{"/", "_"}}),
      GetCurrentTimeMicros(), getpid());
  ASSERT_OK(CreateDirIfMissing(test_dir_));
}

string KeelTest::GetTestPath(const string& relative_path) const {
  CHECK(!test_dir_.empty()) << "Call SetUp() first";
  return test_dir_ + "/" + relative_path;
}

int KeelTest::SeedRandom() {
  int seed;
  if (FLAGS_test_random_seed == 0) {
    // Not specified by user
    seed = static_cast<int>(time(nullptr));
  } else {
    seed = FLAGS_test_random_seed;
  }
  LOG(INFO) << "Using random seed: " << seed;
  srand(static_cast<unsigned>(seed));
  return seed;
}

///////////////////////////////////////////////////
// Test utility functions
///////////////////////////////////////////////////

bool AllowSlowTests() {
  const char* e = getenv(kSlowTestsEnvVar);
  if ((e == nullptr) ||
      (strlen(e) == 0) ||
      (strcasecmp(e, "false") == 0) ||
      (strcasecmp(e, "0") == 0) ||
      (strcasecmp(e, "no") == 0)) {
    return false;
  }
  if ((strcasecmp(e, "true") == 0) ||
      (strcasecmp(e, "1") == 0) ||
      (strcasecmp(e, "yes") == 0)) {
    return true;
  }
  LOG(FATAL) << "Unrecognized value for " << kSlowTestsEnvVar << ": " << e;
  return false;
}

string GetTestDataDirectory() {
  const char* tmpdir = getenv("TEST_TMPDIR");
  string dir = (tmpdir != nullptr && strlen(tmpdir) > 0) ? tmpdir : "/tmp";
  dir += absl::Substitute("/keeltest-$0", getuid());
  CHECK_OK_PREPEND(CreateDirIfMissing(dir), "Could not create test data directory");
  return dir;
}

void AssertEventually(const std::function<void(void)>& f,
                      const MonoDelta& timeout) {
  const MonoTime deadline = MonoTime::Now() + timeout;
  for (int attempts = 1; MonoTime::Now() < deadline; attempts++) {
    // Capture the failures of each attempt so that only the final attempt
    // is reported.
    bool has_fatal = false;
    {
      testing::TestPartResultArray results;
      testing::ScopedFakeTestPartResultReporter reporter(
          testing::ScopedFakeTestPartResultReporter::INTERCEPT_ONLY_CURRENT_THREAD,
          &results);
      f();
      for (int i = 0; i < results.size(); i++) {
        if (results.GetTestPartResult(i).fatally_failed()) {
          has_fatal = true;
          break;
        }
      }
    }
    if (!has_fatal) {
      return;
    }

    // Back off exponentially, capped at one second.
    int sleep_ms = (attempts < 10) ? (1 << attempts) : 1000;
    SleepFor(MonoDelta::FromMilliseconds(std::min(sleep_ms, 1000)));
  }

  // Run once more without capturing failures, so that they get reported to
  // the test as usual.
  f();
}

} // namespace keel
