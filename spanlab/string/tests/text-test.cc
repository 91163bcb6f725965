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

#include "spanlab/base/init.h"
#include "spanlab/base/logging.h"
#include "spanlab/string/numbers.h"
#include "spanlab/string/strip.h"
#include "spanlab/string/text.h"

using namespace spanlab;

void TestText() {
  string s = "hello world";
  Text t(s);
  CHECK_EQ(t.size(), 11);
  CHECK(t.starts_with("hello"));
  CHECK(t.ends_with("world"));
  CHECK_EQ(t.find(' '), 5);
  CHECK(t.substr(6) == "world");
  CHECK(t.substr(0, 5) == Text("hello"));
  CHECK(Text("abc") < Text("abd"));
  CHECK(Text("ab") < Text("abc"));
  CHECK(Text("abc") != Text("abcd"));

  Text u = t;
  u.remove_prefix(6);
  CHECK_EQ(u.str(), "world");
  u.remove_suffix(2);
  CHECK_EQ(u.str(), "wor");
}

void TestStrip() {
  CHECK(StripWhiteSpace(Text("  a b \t\n")) == "a b");
  CHECK(StripWhiteSpace(Text("   ")).empty());

  string s = "\tline\r\n";
  StripWhiteSpace(&s);
  CHECK_EQ(s, "line");

  std::vector<string> lines;
  SplitLines("one\r\ntwo\n\nthree\n", &lines);
  CHECK_EQ(lines.size(), 4);
  CHECK_EQ(lines[0], "one");
  CHECK_EQ(lines[1], "two");
  CHECK_EQ(lines[2], "");
  CHECK_EQ(lines[3], "three");

  SplitLines("last", &lines);
  CHECK_EQ(lines.size(), 1);
  CHECK_EQ(lines[0], "last");
}

void TestNumbers() {
  int32 value = 0;
  CHECK(safe_strto32("42", &value));
  CHECK_EQ(value, 42);
  CHECK(safe_strto32(" -7 ", &value));
  CHECK_EQ(value, -7);
  CHECK(safe_strto32("2147483647", &value));
  CHECK_EQ(value, 2147483647);
  CHECK(!safe_strto32("2147483648", &value));
  CHECK(!safe_strto32("x1", &value));
  CHECK(!safe_strto32("", &value));
  CHECK(!safe_strto32("-", &value));
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestText();
  TestStrip();
  TestNumbers();

  LOG(INFO) << "PASS";
  return 0;
}
