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

#ifndef SPANLAB_UTIL_REGEXP_H_
#define SPANLAB_UTIL_REGEXP_H_

#include <string>
#include <vector>

#include "spanlab/base/macros.h"
#include "spanlab/base/status.h"
#include "spanlab/base/types.h"

namespace re2 {
class RE2;
}  // namespace re2

namespace spanlab {

// Regular expression in RE2 syntax. Matching time is linear in the length of
// the text and does not depend on the stack, so whole documents can be
// searched.
class RegExp {
 public:
  // Match of regular expression in a string. Byte positions are relative to
  // the start of the searched string. Groups that did not participate in the
  // match have begin and end set to -1.
  struct Match {
    std::vector<int> begin;
    std::vector<int> end;
  };

  RegExp() = default;
  ~RegExp();

  // Compile regular expression. Returns an error if the pattern is invalid.
  Status Compile(const string &pattern);

  // Check if the whole string matches the regular expression.
  bool FullMatch(const string &str) const;

  // Find all non-overlapping matches in string from left to right. After an
  // empty match the search continues at the next character.
  void FindAll(const string &str, std::vector<Match> *matches) const;

  // Return regular expression pattern.
  const string &pattern() const { return pattern_; }

  // Return the number of capture groups.
  int groups() const;

 private:
  // Regular expression pattern.
  string pattern_;

  // Compiled regular expression, null until compiled.
  re2::RE2 *regex_ = nullptr;

  DISALLOW_COPY_AND_ASSIGN(RegExp);
};

}  // namespace spanlab

#endif  // SPANLAB_UTIL_REGEXP_H_
