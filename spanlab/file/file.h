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

#ifndef SPANLAB_FILE_FILE_H_
#define SPANLAB_FILE_FILE_H_

#include <string>
#include <vector>

#include "spanlab/base/registry.h"
#include "spanlab/base/status.h"
#include "spanlab/base/types.h"

namespace spanlab {

struct FileStat {
  uint64 size;
  bool is_file;
  bool is_directory;
};

// An open file. File objects are created by File::Open() and deleted by
// Close(), which also reports any error from closing the underlying file.
class File {
 public:
  // Reads up to size bytes. Zero bytes read means end of file.
  virtual Status Read(void *buffer, size_t size, uint64 *read) = 0;
  virtual Status Write(const void *buffer, size_t size) = 0;
  virtual Status Close() = 0;
  virtual string filename() const = 0;

  // Reads from the current position to the end of the file.
  Status ReadToString(string *contents);

  Status WriteString(const string &str) {
    return Write(str.data(), str.size());
  }

  // Writes the line followed by a newline.
  Status WriteLine(const string &line);

  // Makes the registered file systems ready for use. Safe to call repeatedly.
  static void Init();

  // Opens a file with mode "r", "w" or "a", optionally followed by "+".
  static Status Open(const string &name, const char *mode, File **f);

  static Status Delete(const string &name);
  static bool Exists(const string &name);
  static Status Stat(const string &name, FileStat *stat);
  static Status Mkdir(const string &dir);

  // Creates a new uniquely named directory under the temporary directory.
  static Status CreateTempDir(string *dir);

  // Expands a glob pattern into a sorted list of file names. A pattern
  // without matches gives an empty list.
  static Status Match(const string &pattern, std::vector<string> *filenames);

  // Reads or replaces the whole contents of a file.
  static Status ReadContents(const string &filename, string *data);
  static Status WriteContents(const string &filename, const string &data);

 protected:
  virtual ~File() = default;
};

// File system implementation behind the static File functions. The file
// system that reports itself as default serves all file names.
class FileSystem : public Singleton<FileSystem> {
 public:
  virtual ~FileSystem() = default;

  virtual bool IsDefaultFileSystem() = 0;
  virtual Status Open(const string &name, const char *mode, File **f) = 0;
  virtual bool FileExists(const string &filename) = 0;
  virtual Status DeleteFile(const string &filename) = 0;
  virtual Status CreateTempDir(string *dir) = 0;
  virtual Status Stat(const string &name, FileStat *stat) = 0;
  virtual Status CreateDir(const string &dirname) = 0;
  virtual Status Match(const string &pattern,
                       std::vector<string> *filenames) = 0;
};

}  // namespace spanlab

#define REGISTER_FILE_SYSTEM_TYPE(name, component) \
  REGISTER_SINGLETON_TYPE(spanlab::FileSystem, name, component)

#endif  // SPANLAB_FILE_FILE_H_
