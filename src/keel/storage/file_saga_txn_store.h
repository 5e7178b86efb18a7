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
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "keel/storage/saga_txn_store.h"
#include "keel/util/macros.h"
#include "keel/util/status.h"

namespace keel {

// A store keeping one file per transaction record in a directory:
//
//   <dir>/<transaction id>.pb
//
// Every write goes to a temporary file which is synced and then renamed over
// the record file, so a crash leaves either the old or the new record.
//
// Lease acquisition is atomic among the users of one FileSagaTxnStore
// instance. Coordinators in different processes sharing a directory need an
// external guarantee that they don't race on the same record.
class FileSagaTxnStore : public SagaTxnStore {
 public:
  // Opens the store rooted at 'dir', creating the directory if needed.
  static Status Open(const std::string& dir, std::unique_ptr<FileSagaTxnStore>* store);

  Status Upsert(const SagaTxnRecordPB& record) override;
  Status Get(const std::string& txn_id, SagaTxnRecordPB* record) override;
  // Record files that can't be read or parsed are logged and skipped.
  Status List(const SagaTxnFilter& filter,
              std::vector<SagaTxnRecordPB>* records) override;
  Status TryAcquireLease(const std::string& txn_id,
                         const std::string& owner_id,
                         int64_t now_us,
                         int64_t expires_at_us,
                         SagaTxnRecordPB* record) override;

  const std::string& dir() const { return dir_; }

 private:
  explicit FileSagaTxnStore(std::string dir);

  // Returns the path of the record file of 'txn_id', or an error if the id
  // can't be used as a file name.
  Status RecordPath(const std::string& txn_id, std::string* path) const;

  Status ReadRecordUnlocked(const std::string& path, SagaTxnRecordPB* record) const;
  Status WriteRecordUnlocked(const SagaTxnRecordPB& record);

  const std::string dir_;

  // Serializes access to the files of the store.
  std::mutex lock_;

  DISALLOW_COPY_AND_ASSIGN(FileSagaTxnStore);
};

} // namespace keel
