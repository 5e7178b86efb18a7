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

#include "keel/coordinator/service_client.h"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <glog/logging.h>

using std::shared_ptr;
using std::string;
using std::vector;

namespace keel {

Status ServiceClientRegistry::Register(const string& service_name,
                                       shared_ptr<ServiceClient> client) {
  if (service_name.empty()) {
    return Status::InvalidArgument("empty service name");
  }
  if (!client) {
    return Status::InvalidArgument("no client given for service", service_name);
  }
  std::lock_guard<std::mutex> l(lock_);
  bool replaced = clients_.count(service_name) > 0;
  clients_[service_name] = std::move(client);
  LOG(INFO) << (replaced ? "Replaced" : "Registered") << " service client for "
            << service_name;
  return Status::OK();
}

shared_ptr<ServiceClient> ServiceClientRegistry::Lookup(const string& service_name) const {
  std::lock_guard<std::mutex> l(lock_);
  auto it = clients_.find(service_name);
  if (it == clients_.end()) {
    return nullptr;
  }
  return it->second;
}

bool ServiceClientRegistry::Contains(const string& service_name) const {
  std::lock_guard<std::mutex> l(lock_);
  return clients_.count(service_name) > 0;
}

vector<string> ServiceClientRegistry::ServiceNames() const {
  vector<string> names;
  {
    std::lock_guard<std::mutex> l(lock_);
    names.reserve(clients_.size());
    for (const auto& e : clients_) {
      names.push_back(e.first);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace keel
