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
// Base test class, with various utility functions.
#pragma once

#include <functional>
#include <string>

#include <gtest/gtest.h>

#include "keel/util/monotime.h"

namespace keel {

class KeelTest : public ::testing::Test {
 public:
  KeelTest();

  // Cleans up the test directory unless --test_leave_files was given or the
  // test had fatal failures.
  ~KeelTest() override;

  void SetUp() override;

 protected:
  // Returns absolute path based on a unit test-specific work directory, given
  // a relative path. Useful for writing test files that should be deleted after
  // the test ends.
  std::string GetTestPath(const std::string& relative_path) const;

  // Call srand() with a random seed based on the current time, reporting
  // that seed to the logs. The time-based seed may be overridden by passing
  // --test_random_seed= from the CLI in order to reproduce a failed randomized
  // test. Returns the seed.
  int SeedRandom();

  std::string test_dir_;
};

// Returns true if slow tests are runtime-enabled.
bool AllowSlowTests();

// Return the directory which tests should use for their test data.
std::string GetTestDataDirectory();

// Wait until 'f()' succeeds without adding any GTest 'fatal failures'.
// For example:
//
//   AssertEventually([]() {
//     ASSERT_GT(ReadValueOfMetric(), 10);
//   });
//
// The function is run in a loop with exponential backoff, capped at once
// a second. The last attempt runs outside the interception so that its
// failures are reported normally.
void AssertEventually(const std::function<void(void)>& f,
                      const MonoDelta& timeout = MonoDelta::FromSeconds(30));

} // namespace keel
