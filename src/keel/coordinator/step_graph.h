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
#pragma once

#include <string>
#include <vector>

#include "keel/common/saga_types.h"
#include "keel/util/status.h"

namespace keel {

class ServiceClientRegistry;

// Checks on saga definitions, run before anything about a saga is persisted.
class StepGraph {
 public:
  // Maximum length of a transaction id.
  static const size_t kMaxTransactionIdLength;

  // Returns Status::InvalidArgument if 'steps' is not a valid saga:
  //  - there are no steps, or a step id is empty or used twice,
  //  - a step depends on itself or on a step that doesn't exist,
  //  - the dependencies form a cycle,
  //  - no client is registered in 'registry' for a step's service,
  //  - a step has a non-positive timeout or a negative retry count.
  static Status Validate(const std::vector<SagaStep>& steps,
                         const ServiceClientRegistry& registry);

  // Transaction ids are used as storage keys: they must be non-empty, at most
  // kMaxTransactionIdLength bytes, and only use [A-Za-z0-9_.:-].
  static Status ValidateTransactionId(const std::string& txn_id);

  // Orders the steps so that every step comes after all its dependencies.
  // Fails with Status::InvalidArgument naming the steps on a cycle.
  static Status TopologicalSort(const std::vector<SagaStep>& steps,
                                std::vector<std::string>* order);
};

} // namespace keel
