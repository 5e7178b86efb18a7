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

#include "keel/storage/file_saga_txn_store.h"

#include <dirent.h>
#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <absl/strings/match.h>
#include <absl/strings/substitute.h>
#include <glog/logging.h>

#include "keel/util/errno.h"
#include "keel/util/pb_util.h"

using std::string;
using std::unique_ptr;
using std::vector;

namespace keel {

namespace {

const char* const kRecordSuffix = ".pb";

} // anonymous namespace

FileSagaTxnStore::FileSagaTxnStore(string dir)
    : dir_(std::move(dir)) {
}

Status FileSagaTxnStore::Open(const string& dir, unique_ptr<FileSagaTxnStore>* store) {
  if (dir.empty()) {
    return Status::InvalidArgument("empty store directory");
  }
  if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
    return IOErrorFromErrno("Unable to create store directory " + dir, errno);
  }
  struct stat st;
  if (stat(dir.c_str(), &st) != 0) {
    return IOErrorFromErrno("Unable to stat store directory " + dir, errno);
  }
  if (!S_ISDIR(st.st_mode)) {
    return Status::IOError("store path is not a directory", dir, ENOTDIR);
  }
  LOG(INFO) << "Opened saga transaction store at " << dir;
  store->reset(new FileSagaTxnStore(dir));
  return Status::OK();
}

Status FileSagaTxnStore::RecordPath(const string& txn_id, string* path) const {
  if (txn_id.empty() || txn_id == "." || txn_id == ".." ||
      txn_id.find('/') != string::npos) {
    return Status::InvalidArgument("transaction id can't be used as a file name", txn_id);
  }
  *path = absl::Substitute("$0/$1$2", dir_, txn_id, kRecordSuffix);
  return Status::OK();
}

Status FileSagaTxnStore::ReadRecordUnlocked(const string& path,
                                            SagaTxnRecordPB* record) const {
  record->Clear();
  return pb_util::ReadPBFromPath(path, record);
}

Status FileSagaTxnStore::WriteRecordUnlocked(const SagaTxnRecordPB& record) {
  string path;
  RETURN_NOT_OK(RecordPath(record.transaction_id(), &path));
  RETURN_NOT_OK_PREPEND(pb_util::WritePBToPath(path, record),
                        "Unable to write transaction record " + record.transaction_id());
  return Status::OK();
}

Status FileSagaTxnStore::Upsert(const SagaTxnRecordPB& record) {
  if (!record.IsInitialized()) {
    return Status::InvalidArgument("record has no transaction id");
  }
  std::lock_guard<std::mutex> l(lock_);
  return WriteRecordUnlocked(record);
}

Status FileSagaTxnStore::Get(const string& txn_id, SagaTxnRecordPB* record) {
  string path;
  RETURN_NOT_OK(RecordPath(txn_id, &path));
  std::lock_guard<std::mutex> l(lock_);
  Status s = ReadRecordUnlocked(path, record);
  if (s.IsNotFound()) {
    return Status::NotFound("transaction not found", txn_id);
  }
  return s;
}

Status FileSagaTxnStore::List(const SagaTxnFilter& filter,
                              vector<SagaTxnRecordPB>* records) {
  records->clear();
  std::lock_guard<std::mutex> l(lock_);

  vector<string> names;
  DIR* d = opendir(dir_.c_str());
  if (d == nullptr) {
    return IOErrorFromErrno("Unable to open store directory " + dir_, errno);
  }
  errno = 0;
  struct dirent* entry;
  while ((entry = readdir(d)) != nullptr) {
    string name = entry->d_name;
    if (absl::EndsWith(name, kRecordSuffix)) {
      names.emplace_back(std::move(name));
    }
  }
  int err = errno;
  closedir(d);
  if (err != 0) {
    return IOErrorFromErrno("Unable to list store directory " + dir_, err);
  }
  std::sort(names.begin(), names.end());

  for (const auto& name : names) {
    if (filter.limit > 0 && records->size() >= static_cast<size_t>(filter.limit)) {
      break;
    }
    SagaTxnRecordPB record;
    const string path = dir_ + "/" + name;
    Status s = ReadRecordUnlocked(path, &record);
    if (!s.ok()) {
      LOG(ERROR) << "Skipping unreadable transaction record " << path << ": " << s.ToString();
      continue;
    }
    if (RecordMatchesFilter(record, filter)) {
      records->emplace_back(std::move(record));
    }
  }
  return Status::OK();
}

Status FileSagaTxnStore::TryAcquireLease(const string& txn_id,
                                         const string& owner_id,
                                         int64_t now_us,
                                         int64_t expires_at_us,
                                         SagaTxnRecordPB* record) {
  string path;
  RETURN_NOT_OK(RecordPath(txn_id, &path));
  std::lock_guard<std::mutex> l(lock_);
  SagaTxnRecordPB current;
  Status s = ReadRecordUnlocked(path, &current);
  if (s.IsNotFound()) {
    return Status::NotFound("transaction not found", txn_id);
  }
  RETURN_NOT_OK(s);
  RETURN_NOT_OK(ClaimLease(owner_id, now_us, expires_at_us, &current));
  RETURN_NOT_OK(WriteRecordUnlocked(current));
  *record = std::move(current);
  return Status::OK();
}

} // namespace keel
