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

#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "keel/common/saga.pb.h"
#include "keel/common/saga_types.h"
#include "keel/storage/file_saga_txn_store.h"
#include "keel/util/status.h"
#include "keel/util/test_macros.h"
#include "keel/util/test_util.h"

using std::string;
using std::unique_ptr;
using std::vector;

namespace keel {

enum class StoreType {
  kInMemory,
  kFile,
};

class SagaTxnStoreTest : public KeelTest,
                         public ::testing::WithParamInterface<StoreType> {
 public:
  void SetUp() override {
    KeelTest::SetUp();
    NO_FATALS(OpenStore());
  }

 protected:
  void OpenStore() {
    switch (GetParam()) {
      case StoreType::kInMemory:
        store_.reset(new InMemorySagaTxnStore());
        break;
      case StoreType::kFile: {
        unique_ptr<FileSagaTxnStore> file_store;
        ASSERT_OK(FileSagaTxnStore::Open(GetTestPath("txns"), &file_store));
        store_ = std::move(file_store);
        break;
      }
    }
  }

  static SagaTxnRecordPB MakeRecord(const string& id, SagaStatus status,
                                    int64_t timeout_at_us) {
    SagaTxnRecordPB record;
    record.set_transaction_id(id);
    record.set_status(SagaStatusToPB(status));
    record.set_created_at_us(1000);
    record.set_updated_at_us(1000);
    record.set_timeout_at_us(timeout_at_us);
    SagaStepPB* step = record.mutable_definition()->add_steps();
    step->set_step_id("create_order");
    step->set_service_name("orders");
    step->set_action("create");
    step->set_compensation_action("cancel");
    return record;
  }

  unique_ptr<SagaTxnStore> store_;
};

INSTANTIATE_TEST_SUITE_P(Stores, SagaTxnStoreTest,
                         ::testing::Values(StoreType::kInMemory, StoreType::kFile));

TEST_P(SagaTxnStoreTest, TestUpsertAndGet) {
  SagaTxnRecordPB record;
  Status s = store_->Get("t1", &record);
  ASSERT_TRUE(s.IsNotFound()) << s.ToString();

  ASSERT_OK(store_->Upsert(MakeRecord("t1", SagaStatus::kPending, 5000)));
  ASSERT_OK(store_->Get("t1", &record));
  ASSERT_EQ(SAGA_PENDING, record.status());
  ASSERT_EQ(1, record.definition().steps_size());

  // Upserting again replaces the record.
  record.set_status(SAGA_RUNNING);
  record.set_updated_at_us(2000);
  ASSERT_OK(store_->Upsert(record));
  SagaTxnRecordPB reread;
  ASSERT_OK(store_->Get("t1", &reread));
  ASSERT_EQ(SAGA_RUNNING, reread.status());
  ASSERT_EQ(2000, reread.updated_at_us());
}

TEST_P(SagaTxnStoreTest, TestListFilters) {
  ASSERT_OK(store_->Upsert(MakeRecord("a", SagaStatus::kRunning, 100)));
  ASSERT_OK(store_->Upsert(MakeRecord("b", SagaStatus::kCompensating, 200)));
  ASSERT_OK(store_->Upsert(MakeRecord("c", SagaStatus::kCompleted, 300)));
  ASSERT_OK(store_->Upsert(MakeRecord("d", SagaStatus::kRunning, 400)));

  vector<SagaTxnRecordPB> records;
  ASSERT_OK(store_->List(SagaTxnFilter(), &records));
  ASSERT_EQ(4, records.size());

  SagaTxnFilter filter;
  filter.statuses = { SagaStatus::kRunning, SagaStatus::kCompensating };
  ASSERT_OK(store_->List(filter, &records));
  ASSERT_EQ(3, records.size());
  ASSERT_EQ("a", records[0].transaction_id());
  ASSERT_EQ("b", records[1].transaction_id());
  ASSERT_EQ("d", records[2].transaction_id());

  filter.timeout_before_us = 300;
  ASSERT_OK(store_->List(filter, &records));
  ASSERT_EQ(2, records.size());

  filter.limit = 1;
  ASSERT_OK(store_->List(filter, &records));
  ASSERT_EQ(1, records.size());
  ASSERT_EQ("a", records[0].transaction_id());
}

TEST_P(SagaTxnStoreTest, TestListExcludesAndSkipsLiveLeases) {
  ASSERT_OK(store_->Upsert(MakeRecord("a", SagaStatus::kRunning, 100)));
  ASSERT_OK(store_->Upsert(MakeRecord("b", SagaStatus::kRunning, 100)));
  ASSERT_OK(store_->Upsert(MakeRecord("c", SagaStatus::kRunning, 100)));
  ASSERT_OK(store_->Upsert(MakeRecord("d", SagaStatus::kRunning, 100)));
  SagaTxnRecordPB record;
  ASSERT_OK(store_->TryAcquireLease("b", "coord-b", 100, 500, &record));
  ASSERT_OK(store_->TryAcquireLease("c", "coord-a", 100, 500, &record));

  SagaTxnFilter filter;
  filter.exclude_ids = { "a" };
  filter.claimable_by = "coord-a";
  filter.claimable_at_us = 200;
  vector<SagaTxnRecordPB> records;
  ASSERT_OK(store_->List(filter, &records));
  ASSERT_EQ(2, records.size());
  ASSERT_EQ("c", records[0].transaction_id());
  ASSERT_EQ("d", records[1].transaction_id());

  // Skipped records don't use up the limit.
  filter.limit = 1;
  ASSERT_OK(store_->List(filter, &records));
  ASSERT_EQ(1, records.size());
  ASSERT_EQ("c", records[0].transaction_id());

  // Expired leases don't hide a record.
  filter.claimable_at_us = 500;
  filter.limit = 0;
  ASSERT_OK(store_->List(filter, &records));
  ASSERT_EQ(3, records.size());
}

TEST_P(SagaTxnStoreTest, TestListSkipsUnknownStatus) {
  SagaTxnRecordPB record = MakeRecord("x", SagaStatus::kRunning, 100);
  record.clear_status();
  ASSERT_OK(store_->Upsert(record));
  SagaTxnFilter filter;
  filter.statuses = { SagaStatus::kRunning };
  vector<SagaTxnRecordPB> records;
  ASSERT_OK(store_->List(filter, &records));
  ASSERT_TRUE(records.empty());
}

TEST_P(SagaTxnStoreTest, TestLease) {
  SagaTxnRecordPB record;
  Status s = store_->TryAcquireLease("t1", "coord-a", 100, 200, &record);
  ASSERT_TRUE(s.IsNotFound()) << s.ToString();

  ASSERT_OK(store_->Upsert(MakeRecord("t1", SagaStatus::kRunning, 5000)));
  ASSERT_OK(store_->TryAcquireLease("t1", "coord-a", 100, 200, &record));
  ASSERT_EQ("coord-a", record.owner_id());
  ASSERT_EQ(200, record.lease_expires_at_us());

  // Another owner can't take over an unexpired lease.
  s = store_->TryAcquireLease("t1", "coord-b", 150, 250, &record);
  ASSERT_TRUE(s.IsIllegalState()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "leased by coord-a");

  // The owner itself can renew it.
  ASSERT_OK(store_->TryAcquireLease("t1", "coord-a", 150, 300, &record));
  ASSERT_EQ(300, record.lease_expires_at_us());

  // Once expired, anyone can claim it.
  ASSERT_OK(store_->TryAcquireLease("t1", "coord-b", 300, 400, &record));
  ASSERT_EQ("coord-b", record.owner_id());
  SagaTxnRecordPB stored;
  ASSERT_OK(store_->Get("t1", &stored));
  ASSERT_EQ("coord-b", stored.owner_id());
  ASSERT_EQ(400, stored.lease_expires_at_us());
}

class FileSagaTxnStoreTest : public KeelTest {};

TEST_F(FileSagaTxnStoreTest, TestRecordsSurviveReopen) {
  const string dir = GetTestPath("txns");
  {
    unique_ptr<FileSagaTxnStore> store;
    ASSERT_OK(FileSagaTxnStore::Open(dir, &store));
    SagaTxnRecordPB record;
    record.set_transaction_id("persisted");
    record.set_status(SAGA_COMPENSATING);
    record.set_recovery_count(2);
    ASSERT_OK(store->Upsert(record));
  }
  unique_ptr<FileSagaTxnStore> store;
  ASSERT_OK(FileSagaTxnStore::Open(dir, &store));
  SagaTxnRecordPB record;
  ASSERT_OK(store->Get("persisted", &record));
  ASSERT_EQ(SAGA_COMPENSATING, record.status());
  ASSERT_EQ(2, record.recovery_count());
}

TEST_F(FileSagaTxnStoreTest, TestListSkipsUnreadableRecords) {
  const string dir = GetTestPath("txns");
  unique_ptr<FileSagaTxnStore> store;
  ASSERT_OK(FileSagaTxnStore::Open(dir, &store));
  SagaTxnRecordPB record;
  for (const char* id : { "a", "c" }) {
    record.set_transaction_id(id);
    record.set_status(SAGA_RUNNING);
    ASSERT_OK(store->Upsert(record));
  }
  // A truncated record lacks its required fields.
  const string bad_path = dir + "/b.pb";
  FILE* f = fopen(bad_path.c_str(), "w");
  ASSERT_NE(nullptr, f);
  fclose(f);

  Status s = store->Get("b", &record);
  ASSERT_TRUE(s.IsCorruption()) << s.ToString();

  vector<SagaTxnRecordPB> records;
  ASSERT_OK(store->List(SagaTxnFilter(), &records));
  ASSERT_EQ(2, records.size());
  ASSERT_EQ("a", records[0].transaction_id());
  ASSERT_EQ("c", records[1].transaction_id());
}

TEST_F(FileSagaTxnStoreTest, TestRejectsPathLikeIds) {
  unique_ptr<FileSagaTxnStore> store;
  ASSERT_OK(FileSagaTxnStore::Open(GetTestPath("txns"), &store));
  SagaTxnRecordPB record;
  record.set_transaction_id("../escape");
  Status s = store->Upsert(record);
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
}

TEST_F(FileSagaTxnStoreTest, TestOpenFailsOnFile) {
  const string path = GetTestPath("not-a-dir");
  FILE* f = fopen(path.c_str(), "w");
  ASSERT_NE(nullptr, f);
  fclose(f);
  unique_ptr<FileSagaTxnStore> store;
  Status s = FileSagaTxnStore::Open(path, &store);
  ASSERT_TRUE(s.IsIOError()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "not a directory");
}

} // namespace keel
