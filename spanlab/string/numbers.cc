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


#include "spanlab/string/numbers.h"

#include <limits>

#include "spanlab/string/strip.h"

namespace spanlab {

bool safe_strto32(Text text, int32 *value) {
  text = StripWhiteSpace(text);
  if (text.empty()) return false;

  bool negative = false;
  const char *p = text.data();
  const char *end = p + text.size();
  if (*p == '-' || *p == '+') {
    negative = *p == '-';
    p++;
    if (p == end) return false;
  }

  int64 result = 0;
  const int64 limit = negative ? -static_cast<int64>(
      std::numeric_limits<int32>::min()) : std::numeric_limits<int32>::max();
  for (; p < end; ++p) {
    if (*p < '0' || *p > '9') return false;
    result = result * 10 + (*p - '0');
    if (result > limit) return false;
  }

  *value = negative ? -result : result;
  return true;
}

}  // namespace spanlab
