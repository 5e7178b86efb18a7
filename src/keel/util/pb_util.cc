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

#include "keel/util/pb_util.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <string>
#include <utility>

#include <glog/logging.h>
#include <google/protobuf/message_lite.h>

#include "keel/util/errno.h"

using std::string;

namespace keel {
namespace pb_util {

const char* const kTmpSuffix = ".tmp";

namespace {

// Deletes a file when going out of scope, unless cancelled.
class ScopedFileDeleter {
 public:
  explicit ScopedFileDeleter(string path)
      : path_(std::move(path)),
        should_delete_(true) {
  }

  ~ScopedFileDeleter() {
    if (should_delete_ && unlink(path_.c_str()) != 0 && errno != ENOENT) {
      PLOG(WARNING) << "Failed to delete " << path_;
    }
  }

  void Cancel() { should_delete_ = false; }

 private:
  const string path_;
  bool should_delete_;

  DISALLOW_COPY_AND_ASSIGN(ScopedFileDeleter);
};

// Closes a file descriptor when going out of scope.
class ScopedFd {
 public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0) {
      close(fd_);
    }
  }

  int get() const { return fd_; }

  // Close the descriptor, reporting any error.
  Status Close(const string& path) {
    int fd = fd_;
    fd_ = -1;
    if (close(fd) != 0) {
      return IOErrorFromErrno("Failed to Close() " + path, errno);
    }
    return Status::OK();
  }

 private:
  int fd_;

  DISALLOW_COPY_AND_ASSIGN(ScopedFd);
};

Status WriteFully(int fd, const string& data, const string& path) {
  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      return IOErrorFromErrno("Failed to write to " + path, errno);
    }
    written += static_cast<size_t>(n);
  }
  return Status::OK();
}

Status SyncDir(const string& dir) {
  int fd;
  do {
    fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    return IOErrorFromErrno("Failed to open directory " + dir, errno);
  }
  ScopedFd dir_fd(fd);
  if (fsync(dir_fd.get()) != 0) {
    return IOErrorFromErrno("Failed to Sync() directory " + dir, errno);
  }
  return dir_fd.Close(dir);
}

string DirName(const string& path) {
  size_t pos = path.find_last_of('/');
  if (pos == string::npos) {
    return ".";
  }
  if (pos == 0) {
    return "/";
  }
  return path.substr(0, pos);
}

} // anonymous namespace

Status ParseFromArray(MessageLite* msg, const uint8_t* data, uint32_t length) {
  if (!msg->ParseFromArray(data, static_cast<int>(length))) {
    return Status::Corruption("Error parsing msg", msg->InitializationErrorString());
  }
  return Status::OK();
}

Status SerializeToString(const MessageLite& msg, string* output) {
  if (!msg.IsInitialized()) {
    return Status::Corruption("Cannot serialize incomplete msg",
                              msg.InitializationErrorString());
  }
  output->clear();
  if (!msg.AppendToString(output)) {
    return Status::Corruption("Failed to serialize msg");
  }
  return Status::OK();
}

Status WritePBToPath(const string& path, const MessageLite& msg, bool sync_dir) {
  const string path_tmp = path + kTmpSuffix;

  string data;
  RETURN_NOT_OK_PREPEND(SerializeToString(msg, &data),
                        "Failed to serialize to " + path);

  int fd;
  do {
    fd = open(path_tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    return IOErrorFromErrno("Couldn't open file for write " + path_tmp, errno);
  }
  ScopedFd file(fd);
  ScopedFileDeleter tmp_deleter(path_tmp);

  RETURN_NOT_OK(WriteFully(file.get(), data, path_tmp));
  if (fdatasync(file.get()) != 0) {
    return IOErrorFromErrno("Failed to Sync() " + path_tmp, errno);
  }
  RETURN_NOT_OK(file.Close(path_tmp));
  if (rename(path_tmp.c_str(), path.c_str()) != 0) {
    return IOErrorFromErrno("Failed to rename tmp file to " + path, errno);
  }
  tmp_deleter.Cancel();
  if (sync_dir) {
    RETURN_NOT_OK(SyncDir(DirName(path)));
  }
  return Status::OK();
}

Status ReadPBFromPath(const string& path, MessageLite* msg) {
  int fd;
  do {
    fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    if (errno == ENOENT) {
      return Status::NotFound("file does not exist", path, ENOENT);
    }
    return IOErrorFromErrno("Couldn't open file for read " + path, errno);
  }
  ScopedFd file(fd);

  string data;
  char buf[8192];
  while (true) {
    ssize_t n = read(file.get(), buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      return IOErrorFromErrno("Failed to read " + path, errno);
    }
    if (n == 0) break;
    data.append(buf, static_cast<size_t>(n));
  }
  RETURN_NOT_OK(file.Close(path));
  RETURN_NOT_OK_PREPEND(ParseFromArray(msg, reinterpret_cast<const uint8_t*>(data.data()),
                                       static_cast<uint32_t>(data.size())),
                        "Unable to parse PB from path " + path);
  return Status::OK();
}

} // namespace pb_util
} // namespace keel
