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


#ifndef SPANLAB_UTIL_UNICODE_H_
#define SPANLAB_UTIL_UNICODE_H_

#include <string.h>
#include <string>

#include "spanlab/base/types.h"

namespace spanlab {

// Byte length of a UTF-8 sequence indexed by its lead byte.
extern const uint8 utf8_skip_tab[];

// Character classes of code points, as used by the tokenizers.
class Unicode {
 public:
  static bool IsLetter(int c);

  static bool IsDigit(int c);

  static bool IsSpace(int c);

  static int ToLower(int c);
};

// UTF-8 helpers for case-insensitive matching and tokenization.
class UTF8 {
 public:
  // Length in bytes of the character starting at s.
  static int CharLen(const char *s) {
    return utf8_skip_tab[*reinterpret_cast<const uint8 *>(s)];
  }

  // Decodes the character at s, reading at most len bytes. Invalid or
  // truncated sequences give -1.
  static int Decode(const char *s, int len);

  // Appends the UTF-8 encoding of a code point and returns its length.
  static int Encode(int code, string *str);

  // Lowercases each character. Invalid bytes are copied unchanged.
  static void Lowercase(const char *s, int len, string *result);
  static void Lowercase(const string &str, string *result) {
    Lowercase(str.data(), str.size(), result);
  }
  static string Lower(const string &str) {
    string result;
    Lowercase(str, &result);
    return result;
  }
};

}  // namespace spanlab

#endif  // SPANLAB_UTIL_UNICODE_H_
