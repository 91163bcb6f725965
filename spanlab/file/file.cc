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

#include "spanlab/file/file.h"

#include <errno.h>
#include <pthread.h>
#include <algorithm>
#include <string>

#include "spanlab/base/init.h"
#include "spanlab/base/logging.h"

REGISTER_SINGLETON_REGISTRY("file system", spanlab::FileSystem);

namespace spanlab {
namespace {

pthread_once_t init_once = PTHREAD_ONCE_INIT;
FileSystem *file_system = nullptr;

void SelectFileSystem() {
  auto *registry = FileSystem::registry();
  for (auto *fs = registry->components; fs != nullptr; fs = fs->next()) {
    if (fs->object()->IsDefaultFileSystem()) {
      VLOG(2) << "Using " << fs->type() << " file system";
      file_system = fs->object();
    }
  }
}

// Returns null if no file system has been registered.
FileSystem *GetFileSystem() {
  File::Init();
  return file_system;
}

Status NoFileSystem(const string &filename) {
  return Status(ENODEV, "No file system for", filename);
}

}  // namespace

void File::Init() {
  pthread_once(&init_once, SelectFileSystem);
}

Status File::Open(const string &name, const char *mode, File **f) {
  FileSystem *fs = GetFileSystem();
  if (fs == nullptr) return NoFileSystem(name);
  return fs->Open(name, mode, f);
}

Status File::Delete(const string &name) {
  FileSystem *fs = GetFileSystem();
  if (fs == nullptr) return NoFileSystem(name);
  return fs->DeleteFile(name);
}

bool File::Exists(const string &name) {
  FileSystem *fs = GetFileSystem();
  return fs != nullptr && fs->FileExists(name);
}

Status File::Stat(const string &name, FileStat *stat) {
  FileSystem *fs = GetFileSystem();
  if (fs == nullptr) return NoFileSystem(name);
  return fs->Stat(name, stat);
}

Status File::Mkdir(const string &dir) {
  FileSystem *fs = GetFileSystem();
  if (fs == nullptr) return NoFileSystem(dir);
  return fs->CreateDir(dir);
}

Status File::CreateTempDir(string *dir) {
  FileSystem *fs = GetFileSystem();
  if (fs == nullptr) return NoFileSystem("temporary directory");
  return fs->CreateTempDir(dir);
}

Status File::Match(const string &pattern, std::vector<string> *filenames) {
  FileSystem *fs = GetFileSystem();
  if (fs == nullptr) return NoFileSystem(pattern);
  Status st = fs->Match(pattern, filenames);
  if (!st.ok()) return st;
  std::sort(filenames->begin(), filenames->end());
  return Status::OK;
}

Status File::ReadContents(const string &filename, string *data) {
  File *f;
  Status st = Open(filename, "r", &f);
  if (!st.ok()) return st;
  st = f->ReadToString(data);
  Status closed = f->Close();
  return st.ok() ? closed : st;
}

Status File::WriteContents(const string &filename, const string &data) {
  File *f;
  Status st = Open(filename, "w", &f);
  if (!st.ok()) return st;
  st = f->WriteString(data);
  Status closed = f->Close();
  return st.ok() ? closed : st;
}

Status File::ReadToString(string *contents) {
  contents->clear();
  char chunk[8192];
  for (;;) {
    uint64 read;
    Status st = Read(chunk, sizeof(chunk), &read);
    if (!st.ok()) return st;
    if (read == 0) break;
    contents->append(chunk, read);
  }
  return Status::OK;
}

Status File::WriteLine(const string &line) {
  Status st = WriteString(line);
  if (!st.ok()) return st;
  return Write("\n", 1);
}

REGISTER_INITIALIZER(filesystem, {
  File::Init();
});

}  // namespace spanlab
