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

#include "spanlab/string/text.h"

#include <algorithm>
#include <ostream>

namespace spanlab {

const ssize_t Text::npos;

ssize_t Text::find(char c, ssize_t pos) const {
  if (pos < 0 || pos >= size_) return npos;
  const void *hit = memchr(data_ + pos, c, size_ - pos);
  if (hit == nullptr) return npos;
  return static_cast<const char *>(hit) - data_;
}

ssize_t Text::find(Text t, ssize_t pos) const {
  if (pos < 0 || pos + t.size_ > size_) return npos;
  const char *hit = std::search(begin() + pos, end(), t.begin(), t.end());
  return hit == end() && !t.empty() ? npos : hit - data_;
}

Text Text::substr(ssize_t pos, ssize_t n) const {
  if (pos > size_) pos = size_;
  if (n < 0 || n > size_ - pos) n = size_ - pos;
  return Text(data_ + pos, n);
}

std::ostream &operator<<(std::ostream &out, Text t) {
  return out.write(t.data(), t.size());
}

}  // namespace spanlab
