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

#include "spanlab/util/regexp.h"

#include <re2/re2.h>
#include <string>
#include <vector>

#include "spanlab/util/unicode.h"

namespace spanlab {

RegExp::~RegExp() {
  delete regex_;
}

Status RegExp::Compile(const string &pattern) {
  delete regex_;
  pattern_ = pattern;
  RE2::Options options;
  options.set_log_errors(false);
  regex_ = new RE2(pattern, options);
  if (!regex_->ok()) {
    Status st(1, "Invalid regular expression '" + pattern + "': " +
              regex_->error());
    delete regex_;
    regex_ = nullptr;
    return st;
  }
  return Status::OK;
}

int RegExp::groups() const {
  return regex_ == nullptr ? 0 : regex_->NumberOfCapturingGroups();
}

bool RegExp::FullMatch(const string &str) const {
  if (regex_ == nullptr) return false;
  return RE2::FullMatch(str, *regex_);
}

void RegExp::FindAll(const string &str, std::vector<Match> *matches) const {
  matches->clear();
  if (regex_ == nullptr) return;
  re2::StringPiece text(str);
  int n = regex_->NumberOfCapturingGroups() + 1;
  std::vector<re2::StringPiece> group(n);
  size_t pos = 0;
  while (pos <= str.size() &&
         regex_->Match(text, pos, str.size(), RE2::UNANCHORED,
                       group.data(), n)) {
    Match match;
    for (int i = 0; i < n; ++i) {
      if (group[i].data() == nullptr) {
        match.begin.push_back(-1);
        match.end.push_back(-1);
      } else {
        int begin = group[i].data() - str.data();
        match.begin.push_back(begin);
        match.end.push_back(begin + group[i].size());
      }
    }
    size_t end = match.end[0];
    if (group[0].empty()) {
      // Step over one character to move past an empty match.
      end += end < str.size() ? UTF8::CharLen(str.data() + end) : 1;
    }
    matches->push_back(match);
    pos = end;
  }
}

}  // namespace spanlab
