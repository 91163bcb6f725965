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


#include <string>
#include <vector>

#include "spanlab/base/flags.h"
#include "spanlab/base/init.h"
#include "spanlab/base/logging.h"
#include "spanlab/file/file.h"
#include "spanlab/file/resource.h"

DECLARE_string(resource_path);

using namespace spanlab;

void TestFiles(const string &dir) {
  string a = dir + "/b.txt";
  string b = dir + "/a.txt";
  CHECK(File::WriteContents(a, "second file\n"));
  CHECK(File::WriteContents(b, "first file\n"));
  CHECK(File::Exists(a));
  CHECK(!File::Exists(dir + "/missing.txt"));

  string contents;
  CHECK(File::ReadContents(b, &contents));
  CHECK_EQ(contents, "first file\n");

  FileStat stat;
  CHECK(File::Stat(a, &stat));
  CHECK(stat.is_file);
  CHECK(!stat.is_directory);
  CHECK_EQ(stat.size, 12);
  CHECK(File::Stat(dir, &stat));
  CHECK(stat.is_directory);

  // Append lines to file.
  File *f;
  CHECK(File::Open(b, "a", &f));
  CHECK(f->WriteLine("more"));
  CHECK(f->Close());
  CHECK(File::Open(b, "r", &f));
  CHECK(f->ReadToString(&contents));
  CHECK(f->Close());
  CHECK_EQ(contents, "first file\nmore\n");

  // Matching returns sorted file names.
  std::vector<string> files;
  CHECK(File::Match(dir + "/*.txt", &files));
  CHECK_EQ(files.size(), 2);
  CHECK_EQ(files[0], b);
  CHECK_EQ(files[1], a);
  files.clear();
  CHECK(File::Match(dir + "/*.none", &files));
  CHECK(files.empty());

  // Opening a missing file fails.
  Status st = File::Open(dir + "/missing.txt", "r", &f);
  CHECK(!st.ok());

  CHECK(File::Delete(a));
  CHECK(!File::Exists(a));
}

void TestResources(const string &dir) {
  string sub = dir + "/resources";
  CHECK(File::Mkdir(sub));
  CHECK(File::WriteContents(sub + "/names.txt", "alpha\r\n beta \n"));

  string filename;
  Status st = ResolveResource("names.txt", &filename);
  CHECK(!st.ok());

  FLAGS_resource_path = "/nonexistent:" + sub;
  std::vector<string> path = ResourcePath();
  CHECK_EQ(path.size(), 2);
  CHECK_EQ(path[1], sub);

  CHECK(ResolveResource("names.txt", &filename));
  CHECK_EQ(filename, sub + "/names.txt");

  std::vector<string> lines;
  CHECK(ReadResourceLines("names.txt", &lines));
  CHECK_EQ(lines.size(), 2);
  CHECK_EQ(lines[0], "alpha");
  CHECK_EQ(lines[1], " beta ");

  // Files are found as given before the resource path is searched.
  CHECK(ResolveResource(sub + "/names.txt", &filename));
  CHECK_EQ(filename, sub + "/names.txt");
  FLAGS_resource_path = "";
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  string dir;
  CHECK(File::CreateTempDir(&dir));
  TestFiles(dir);
  TestResources(dir);

  LOG(INFO) << "PASS";
  return 0;
}
