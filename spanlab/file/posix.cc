// Copyright 2017 Google Inc.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.



#include <errno.h>
#include <fcntl.h>
#include <glob.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "spanlab/file/file.h"

namespace spanlab {

namespace {

Status IOError(const string &context, int error) {
  return Status(error, context.c_str(), strerror(error));
}

int OpenFlags(const char *mode) {
  int flags = 0;
  switch (*mode++) {
    case 'r': flags = O_RDONLY; break;
    case 'w': flags = O_WRONLY | O_CREAT | O_TRUNC; break;
    case 'a': flags = O_WRONLY | O_CREAT | O_APPEND; break;
  }

  if (*mode == '+') {
    flags &= ~(O_RDONLY | O_WRONLY);
    flags |= O_RDWR;
  }

  return flags;
}

// Temporary files go under $TMPDIR, falling back to /tmp.
string TempDir() {
  const char *dir = getenv("TMPDIR");
  return dir != nullptr && *dir != 0 ? dir : "/tmp";
}

}  // namespace

// File backed by a POSIX file descriptor.
class PosixFile : public File {
 public:
  PosixFile(int fd, const string &filename)
      : fd_(fd), filename_(filename) {}

  ~PosixFile() override {
    if (fd_ != -1) close(fd_);
  }

  Status Read(void *buffer, size_t size, uint64 *read) override {
    ssize_t rc;
    do {
      rc = ::read(fd_, buffer, size);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) return IOError(filename_, errno);
    *read = rc;
    return Status::OK;
  }

  // Partial writes are continued until all data has been written.
  Status Write(const void *buffer, size_t size) override {
    const char *data = static_cast<const char *>(buffer);
    while (size > 0) {
      ssize_t rc = ::write(fd_, data, size);
      if (rc < 0) {
        if (errno == EINTR) continue;
        return IOError(filename_, errno);
      }
      data += rc;
      size -= rc;
    }
    return Status::OK;
  }

  Status Close() override {
    int rc = close(fd_);
    int error = errno;
    fd_ = -1;
    Status st = rc == 0 ? Status::OK : IOError(filename_, error);
    delete this;
    return st;
  }

  string filename() const override { return filename_; }

 private:
  int fd_;
  string filename_;
};

class PosixFileSystem : public FileSystem {
 public:
  bool IsDefaultFileSystem() override { return true; }

  Status Open(const string &name, const char *mode, File **f) override {
    int fd = open(name.c_str(), OpenFlags(mode), 0644);
    if (fd == -1) return IOError(name, errno);

    // Directories cannot be read as files.
    struct stat st;
    if (fstat(fd, &st) == 0 && S_ISDIR(st.st_mode)) {
      close(fd);
      return IOError(name, EISDIR);
    }

    *f = new PosixFile(fd, name);
    return Status::OK;
  }

  Status CreateTempDir(string *dir) override {
    string name = TempDir() + "/spanlab.XXXXXX";
    std::vector<char> buffer(name.begin(), name.end());
    buffer.push_back(0);
    if (mkdtemp(buffer.data()) == nullptr) return IOError(name, errno);
    *dir = buffer.data();
    return Status::OK;
  }

  bool FileExists(const string &filename) override {
    return access(filename.c_str(), F_OK) == 0;
  }

  Status DeleteFile(const string &filename) override {
    if (unlink(filename.c_str()) != 0) return IOError(filename, errno);
    return Status::OK;
  }

  Status Stat(const string &filename, FileStat *stat) override {
    struct stat st;
    if (::stat(filename.c_str(), &st) != 0) return IOError(filename, errno);
    stat->size = st.st_size;
    stat->is_file = S_ISREG(st.st_mode);
    stat->is_directory = S_ISDIR(st.st_mode);
    return Status::OK;
  }

  Status CreateDir(const string &dirname) override {
    if (mkdir(dirname.c_str(), 0755) != 0) return IOError(dirname, errno);
    return Status::OK;
  }

  Status Match(const string &pattern,
               std::vector<string> *filenames) override {
    glob_t matches;
    int rc = glob(pattern.c_str(), 0, nullptr, &matches);
    if (rc == 0) {
      for (size_t i = 0; i < matches.gl_pathc; ++i) {
        filenames->emplace_back(matches.gl_pathv[i]);
      }
    }
    globfree(&matches);
    if (rc != 0 && rc != GLOB_NOMATCH) return IOError(pattern, EIO);
    return Status::OK;
  }
};

REGISTER_FILE_SYSTEM_TYPE("posix", PosixFileSystem);

}  // namespace spanlab
