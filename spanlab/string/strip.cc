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


#include "spanlab/string/strip.h"

#include <string>
#include <vector>

namespace spanlab {

static bool IsWhiteSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

Text StripWhiteSpace(Text text) {
  ssize_t begin = 0;
  ssize_t end = text.size();
  while (begin < end && IsWhiteSpace(text[begin])) begin++;
  while (end > begin && IsWhiteSpace(text[end - 1])) end--;
  return text.substr(begin, end - begin);
}

void StripWhiteSpace(string *str) {
  Text stripped = StripWhiteSpace(Text(*str));
  string result = stripped.str();
  str->swap(result);
}

void SplitLines(Text text, std::vector<string> *lines) {
  lines->clear();
  ssize_t start = 0;
  while (start < text.size()) {
    ssize_t nl = text.find('\n', start);
    if (nl == Text::npos) nl = text.size();
    Text line = text.substr(start, nl - start);
    if (line.ends_with("\r")) line.remove_suffix(1);
    lines->push_back(line.str());
    start = nl + 1;
  }
}

}  // namespace spanlab
