// Copyright 2026 The spanlab Authors.
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


#include "spanlab/file/resource.h"

#include <errno.h>
#include <string>
#include <vector>

#include "spanlab/base/flags.h"
#include "spanlab/base/logging.h"
#include "spanlab/file/file.h"
#include "spanlab/string/strip.h"

DEFINE_string(resource_path, "",
              "Colon-separated list of directories with resource files");

namespace spanlab {

std::vector<string> ResourcePath() {
  std::vector<string> dirs;
  const string &path = FLAGS_resource_path;
  size_t start = 0;
  while (start <= path.size()) {
    size_t colon = path.find(':', start);
    if (colon == string::npos) colon = path.size();
    if (colon > start) dirs.push_back(path.substr(start, colon - start));
    start = colon + 1;
  }
  return dirs;
}

Status ResolveResource(const string &name, string *filename) {
  if (name.empty()) return Status(ENOENT, "Empty resource name");

  // Try resource name as file name.
  if (File::Exists(name)) {
    *filename = name;
    return Status::OK;
  }

  // Look for resource in resource path.
  if (name[0] != '/') {
    for (const string &dir : ResourcePath()) {
      string fn = dir + "/" + name;
      if (File::Exists(fn)) {
        VLOG(2) << "Resource " << name << " found in " << dir;
        *filename = fn;
        return Status::OK;
      }
    }
  }

  return Status(ENOENT, "Resource not found", name);
}

Status ReadResource(const string &name, string *contents) {
  string filename;
  Status st = ResolveResource(name, &filename);
  if (!st.ok()) return st;
  return File::ReadContents(filename, contents);
}

Status ReadResourceLines(const string &name, std::vector<string> *lines) {
  string contents;
  Status st = ReadResource(name, &contents);
  if (!st.ok()) return st;
  SplitLines(contents, lines);
  return Status::OK;
}

}  // namespace spanlab
