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

#include "keel/coordinator/step_graph.h"

#include <cctype>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <absl/strings/str_join.h>
#include <absl/strings/substitute.h>

#include "keel/coordinator/service_client.h"

using std::map;
using std::set;
using std::string;
using std::vector;

namespace keel {

const size_t StepGraph::kMaxTransactionIdLength = 128;

Status StepGraph::Validate(const vector<SagaStep>& steps,
                           const ServiceClientRegistry& registry) {
  if (steps.empty()) {
    return Status::InvalidArgument("saga has no steps");
  }
  set<string> ids;
  for (const auto& step : steps) {
    if (step.step_id.empty()) {
      return Status::InvalidArgument("step with an empty step id");
    }
    if (!ids.insert(step.step_id).second) {
      return Status::InvalidArgument("duplicate step id", step.step_id);
    }
  }
  for (const auto& step : steps) {
    for (const auto& dep : step.depends_on) {
      if (dep == step.step_id) {
        return Status::InvalidArgument(
            absl::Substitute("step $0 depends on itself", step.step_id));
      }
      if (ids.count(dep) == 0) {
        return Status::InvalidArgument(
            absl::Substitute("step $0 depends on unknown step $1", step.step_id, dep));
      }
    }
    if (!registry.Contains(step.service_name)) {
      return Status::InvalidArgument(
          absl::Substitute("no service client registered for service '$0' of step $1 "
                           "(registered: [$2])",
                           step.service_name, step.step_id,
                           absl::StrJoin(registry.ServiceNames(), ", ")));
    }
    if (step.timeout_s <= 0) {
      return Status::InvalidArgument(
          absl::Substitute("step $0 has a non-positive timeout: $1s",
                           step.step_id, step.timeout_s));
    }
    if (step.retry_count < 0) {
      return Status::InvalidArgument(
          absl::Substitute("step $0 has a negative retry count: $1",
                           step.step_id, step.retry_count));
    }
  }
  vector<string> order;
  return TopologicalSort(steps, &order);
}

Status StepGraph::TopologicalSort(const vector<SagaStep>& steps, vector<string>* order) {
  // Kahn's algorithm: repeatedly take the steps with no unprocessed
  // dependencies. Steps left over are on, or behind, a cycle.
  map<string, int> in_degree;
  map<string, vector<string>> dependents;
  for (const auto& step : steps) {
    in_degree[step.step_id] += 0;
    for (const auto& dep : step.depends_on) {
      in_degree[step.step_id]++;
      dependents[dep].push_back(step.step_id);
    }
  }

  std::deque<string> ready;
  for (const auto& step : steps) {
    if (in_degree[step.step_id] == 0) {
      ready.push_back(step.step_id);
    }
  }
  order->clear();
  while (!ready.empty()) {
    string id = ready.front();
    ready.pop_front();
    order->push_back(id);
    for (const auto& dependent : dependents[id]) {
      if (--in_degree[dependent] == 0) {
        ready.push_back(dependent);
      }
    }
  }

  if (order->size() != steps.size()) {
    vector<string> blocked;
    for (const auto& e : in_degree) {
      if (e.second > 0) {
        blocked.push_back(e.first);
      }
    }
    return Status::InvalidArgument("dependency cycle among steps",
                                   absl::StrJoin(blocked, ", "));
  }
  return Status::OK();
}

Status StepGraph::ValidateTransactionId(const string& txn_id) {
  if (txn_id.empty()) {
    return Status::InvalidArgument("empty transaction id");
  }
  if (txn_id.size() > kMaxTransactionIdLength) {
    return Status::InvalidArgument(
        absl::Substitute("transaction id is longer than $0 bytes", kMaxTransactionIdLength),
        txn_id.substr(0, kMaxTransactionIdLength) + "...");
  }
  if (txn_id == "." || txn_id == "..") {
    return Status::InvalidArgument("invalid transaction id", txn_id);
  }
  for (char c : txn_id) {
    if (!isalnum(static_cast<unsigned char>(c)) &&
        c != '_' && c != '.' && c != ':' && c != '-') {
      return Status::InvalidArgument("invalid character in transaction id", txn_id);
    }
  }
  return Status::OK();
}

} // namespace keel
