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

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "keel/common/saga.pb.h"
#include "keel/common/saga_types.h"
#include "keel/util/macros.h"
#include "keel/util/status.h"

namespace keel {

// Selects records in SagaTxnStore::List().
struct SagaTxnFilter {
  // Only records in one of these statuses are returned. Empty matches any
  // status.
  std::set<SagaStatus> statuses;

  // If positive, only records whose 'timeout_at_us' is strictly before this
  // time are returned.
  int64_t timeout_before_us = 0;

  // Records with these ids are skipped.
  std::set<std::string> exclude_ids;

  // If set, records leased by another owner until after 'claimable_at_us'
  // are skipped, leaving those 'claimable_by' may claim at that time.
  std::string claimable_by;
  int64_t claimable_at_us = 0;

  // If positive, at most this many records are returned. Only selected
  // records count towards the limit.
  int limit = 0;
};

// Returns true if 'record' is selected by 'filter'. Records with an unknown
// status never match a non-empty status set. The limit is not considered.
bool RecordMatchesFilter(const SagaTxnRecordPB& record, const SagaTxnFilter& filter);

// Durable storage of saga transaction records, treated as a single logical
// table keyed by transaction id. Implementations must be thread-safe.
//
// Records are never deleted by the coordinator.
class SagaTxnStore {
 public:
  virtual ~SagaTxnStore() {}

  // Atomically inserts or replaces the record keyed by 'record.transaction_id'.
  virtual Status Upsert(const SagaTxnRecordPB& record) = 0;

  // Looks up a record by id. Returns Status::NotFound if there is none.
  virtual Status Get(const std::string& txn_id, SagaTxnRecordPB* record) = 0;

  // Returns the records selected by 'filter', ordered by transaction id.
  virtual Status List(const SagaTxnFilter& filter,
                      std::vector<SagaTxnRecordPB>* records) = 0;

  // Atomically claims the record for 'owner_id' until 'expires_at_us', and
  // returns the claimed record in 'record'. Fails with Status::IllegalState
  // if a different owner holds a lease that has not expired by 'now_us', and
  // with Status::NotFound if there is no such record.
  virtual Status TryAcquireLease(const std::string& txn_id,
                                 const std::string& owner_id,
                                 int64_t now_us,
                                 int64_t expires_at_us,
                                 SagaTxnRecordPB* record) = 0;
};

// Shared by the store implementations: checks whether 'owner_id' may claim
// 'record' at 'now_us', and if so updates the lease fields of 'record'.
Status ClaimLease(const std::string& owner_id, int64_t now_us, int64_t expires_at_us,
                  SagaTxnRecordPB* record);

// A store keeping the records in memory. Used in tests and by embedders that
// don't need the records to outlive the process.
class InMemorySagaTxnStore : public SagaTxnStore {
 public:
  InMemorySagaTxnStore() {}

  Status Upsert(const SagaTxnRecordPB& record) override;
  Status Get(const std::string& txn_id, SagaTxnRecordPB* record) override;
  Status List(const SagaTxnFilter& filter,
              std::vector<SagaTxnRecordPB>* records) override;
  Status TryAcquireLease(const std::string& txn_id,
                         const std::string& owner_id,
                         int64_t now_us,
                         int64_t expires_at_us,
                         SagaTxnRecordPB* record) override;

 private:
  std::mutex lock_;
  std::map<std::string, SagaTxnRecordPB> records_;

  DISALLOW_COPY_AND_ASSIGN(InMemorySagaTxnStore);
};

} // namespace keel
