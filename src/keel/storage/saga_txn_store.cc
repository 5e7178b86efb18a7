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

#include "keel/storage/saga_txn_store.h"

#include <string>
#include <vector>

#include <absl/strings/substitute.h>
#include <glog/logging.h>

#include "keel/util/wall_clock.h"

using std::string;
using std::vector;

namespace keel {

namespace {

bool IsLeasedByOther(const SagaTxnRecordPB& record, const string& owner_id, int64_t now_us) {
  return record.has_owner_id() && !record.owner_id().empty() &&
      record.owner_id() != owner_id &&
      record.lease_expires_at_us() > now_us;
}

} // anonymous namespace

bool RecordMatchesFilter(const SagaTxnRecordPB& record, const SagaTxnFilter& filter) {
  if (!filter.statuses.empty()) {
    SagaStatus status;
    if (!SagaStatusFromPB(record.status(), &status).ok()) {
      return false;
    }
    if (filter.statuses.count(status) == 0) {
      return false;
    }
  }
  if (filter.timeout_before_us > 0 &&
      record.timeout_at_us() >= filter.timeout_before_us) {
    return false;
  }
  if (filter.exclude_ids.count(record.transaction_id()) > 0) {
    return false;
  }
  if (!filter.claimable_by.empty() && IsLeasedByOther(record, filter.claimable_by,
                                                      filter.claimable_at_us)) {
    return false;
  }
  return true;
}

Status ClaimLease(const string& owner_id, int64_t now_us, int64_t expires_at_us,
                  SagaTxnRecordPB* record) {
  DCHECK(!owner_id.empty());
  if (IsLeasedByOther(*record, owner_id, now_us)) {
    return Status::IllegalState(
        absl::Substitute("transaction $0 is leased by $1 until $2",
                         record->transaction_id(), record->owner_id(),
                         TimestampToString(record->lease_expires_at_us())));
  }
  record->set_owner_id(owner_id);
  record->set_lease_expires_at_us(expires_at_us);
  return Status::OK();
}

Status InMemorySagaTxnStore::Upsert(const SagaTxnRecordPB& record) {
  if (!record.IsInitialized() || record.transaction_id().empty()) {
    return Status::InvalidArgument("record has no transaction id");
  }
  std::lock_guard<std::mutex> l(lock_);
  records_[record.transaction_id()] = record;
  return Status::OK();
}

Status InMemorySagaTxnStore::Get(const string& txn_id, SagaTxnRecordPB* record) {
  std::lock_guard<std::mutex> l(lock_);
  auto it = records_.find(txn_id);
  if (it == records_.end()) {
    return Status::NotFound("transaction not found", txn_id);
  }
  *record = it->second;
  return Status::OK();
}

Status InMemorySagaTxnStore::List(const SagaTxnFilter& filter,
                                  vector<SagaTxnRecordPB>* records) {
  records->clear();
  std::lock_guard<std::mutex> l(lock_);
  for (const auto& e : records_) {
    if (filter.limit > 0 && records->size() >= static_cast<size_t>(filter.limit)) {
      break;
    }
    if (RecordMatchesFilter(e.second, filter)) {
      records->push_back(e.second);
    }
  }
  return Status::OK();
}

Status InMemorySagaTxnStore::TryAcquireLease(const string& txn_id,
                                             const string& owner_id,
                                             int64_t now_us,
                                             int64_t expires_at_us,
                                             SagaTxnRecordPB* record) {
  std::lock_guard<std::mutex> l(lock_);
  auto it = records_.find(txn_id);
  if (it == records_.end()) {
    return Status::NotFound("transaction not found", txn_id);
  }
  RETURN_NOT_OK(ClaimLease(owner_id, now_us, expires_at_us, &it->second));
  *record = it->second;
  return Status::OK();
}

} // namespace keel
