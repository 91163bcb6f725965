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

#ifndef SPANLAB_STRING_TEXT_H_
#define SPANLAB_STRING_TEXT_H_

#include <string.h>
#include <sys/types.h>
#include <iosfwd>
#include <string>

#include "spanlab/base/logging.h"
#include "spanlab/base/types.h"

namespace spanlab {

// Text is a read-only view of a range of characters owned by someone else,
// typically a document or a program source. Positions are byte offsets.
class Text {
 public:
  // Returned by the find functions when there is no match.
  static const ssize_t npos = -1;

  Text() : data_(nullptr), size_(0) {}
  Text(const char *str) : data_(str), size_(str == nullptr ? 0 : strlen(str)) {}
  Text(const string &str) : data_(str.data()), size_(str.size()) {}
  Text(const char *data, ssize_t size) : data_(data), size_(size) {}

  const char *data() const { return data_; }
  ssize_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  const char *begin() const { return data_; }
  const char *end() const { return data_ + size_; }

  char operator[](ssize_t index) const {
    DCHECK_GE(index, 0);
    DCHECK_LT(index, size_);
    return data_[index];
  }

  string str() const { return empty() ? string() : string(data_, size_); }

  // Drops n characters from the front or the back of the view.
  void remove_prefix(ssize_t n) {
    DCHECK_LE(n, size_);
    data_ += n;
    size_ -= n;
  }
  void remove_suffix(ssize_t n) {
    DCHECK_LE(n, size_);
    size_ -= n;
  }

  bool starts_with(Text prefix) const {
    return size_ >= prefix.size_ &&
           memcmp(data_, prefix.data_, prefix.size_) == 0;
  }
  bool ends_with(Text suffix) const {
    return size_ >= suffix.size_ &&
           memcmp(end() - suffix.size_, suffix.data_, suffix.size_) == 0;
  }

  // Returns the position of the first occurrence at or after pos, or npos.
  ssize_t find(char c, ssize_t pos = 0) const;
  ssize_t find(Text t, ssize_t pos = 0) const;

  // Returns at most n characters starting at pos. Both are clipped to the
  // end of the view.
  Text substr(ssize_t pos, ssize_t n = npos) const;

 private:
  const char *data_;
  ssize_t size_;
};

inline bool operator==(Text x, Text y) {
  return x.size() == y.size() && memcmp(x.data(), y.data(), x.size()) == 0;
}

inline bool operator!=(Text x, Text y) { return !(x == y); }

// Byte-wise lexicographic order.
inline bool operator<(Text x, Text y) {
  ssize_t common = x.size() < y.size() ? x.size() : y.size();
  int cmp = memcmp(x.data(), y.data(), common);
  return cmp != 0 ? cmp < 0 : x.size() < y.size();
}

std::ostream &operator<<(std::ostream &out, Text t);

}  // namespace spanlab

#endif  // SPANLAB_STRING_TEXT_H_
