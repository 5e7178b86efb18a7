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

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "keel/common/saga_types.h"
#include "keel/util/macros.h"
#include "keel/util/monotime.h"
#include "keel/util/status.h"

namespace keel {

// A business service taking part in sagas. The same entry point serves both
// forward actions and compensation actions.
//
// Implementations must be thread-safe: a client is shared by every step bound
// to its service, and steps run concurrently. Actions and compensations must
// be idempotent, since a step in flight when its coordinator crashed is
// invoked again after recovery.
class ServiceClient {
 public:
  virtual ~ServiceClient() {}

  // Invokes 'action' with 'payload', filling in 'result' on success.
  //
  // The coordinator stops waiting for the call at 'deadline' and treats it as
  // timed out; implementations should give up by then too.
  virtual Status Call(const std::string& action,
                      const Payload& payload,
                      const MonoTime& deadline,
                      Payload* result) = 0;
};

// Maps service names to the clients serving them. Thread-safe.
class ServiceClientRegistry {
 public:
  ServiceClientRegistry() {}

  // Binds 'service_name' to 'client', replacing any previous binding.
  Status Register(const std::string& service_name,
                  std::shared_ptr<ServiceClient> client);

  // Returns the client bound to 'service_name', or nullptr if there is none.
  std::shared_ptr<ServiceClient> Lookup(const std::string& service_name) const;

  bool Contains(const std::string& service_name) const;

  std::vector<std::string> ServiceNames() const;

 private:
  mutable std::mutex lock_;
  std::unordered_map<std::string, std::shared_ptr<ServiceClient>> clients_;

  DISALLOW_COPY_AND_ASSIGN(ServiceClientRegistry);
};

} // namespace keel
