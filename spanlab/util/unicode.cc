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


#include "spanlab/util/unicode.h"

#include <locale.h>
#include <wctype.h>
#include <string>

#include "spanlab/base/logging.h"
#include "spanlab/base/types.h"

namespace spanlab {

namespace {

// Character classification outside ASCII uses the wide character tables of
// the C library in a UTF-8 locale.
locale_t UnicodeLocale() {
  static locale_t locale = nullptr;
  static bool initialized = false;
  if (!initialized) {
    locale = newlocale(LC_CTYPE_MASK, "C.UTF-8", nullptr);
    if (locale == nullptr) {
      locale = newlocale(LC_CTYPE_MASK, "en_US.UTF-8", nullptr);
    }
    if (locale == nullptr) {
      VLOG(1) << "No UTF-8 locale, using current locale for Unicode";
      locale = duplocale(LC_GLOBAL_LOCALE);
    }
    initialized = true;
  }
  return locale;
}

}  // namespace

// UTF8 character length based on lead byte.
const uint8 utf8_skip_tab[256] = {
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,
  2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,2,
  3,3,3,3,3,3,3,3,3,3,3,3,3,3,3,3,4,4,4,4,4,4,4,4,4,4,4,4,4,4,4,4,
};

bool Unicode::IsLetter(int c) {
  if (c < 0x80) return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
  return iswalpha_l(c, UnicodeLocale()) && !iswdigit_l(c, UnicodeLocale());
}

bool Unicode::IsDigit(int c) {
  return c >= '0' && c <= '9';
}

bool Unicode::IsSpace(int c) {
  if (c < 0x80) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
           c == '\f' || c == '\v';
  }
  return iswspace_l(c, UnicodeLocale()) || c == 0xa0;
}

int Unicode::ToLower(int c) {
  if (c < 0x80) return (c >= 'A' && c <= 'Z') ? c + ('a' - 'A') : c;
  return towlower_l(c, UnicodeLocale());
}

int UTF8::Decode(const char *s, int len) {
  // No more data.
  if (len <= 0) return -1;

  // One character sequence (7-bit value).
  int c0 = *reinterpret_cast<const uint8 *>(s);
  if (c0 < 0x80) return c0;
  if (len <= 1) return -1;

  // Two character sequence (11-bit value).
  int c1 = *reinterpret_cast<const uint8 *>(s + 1) ^ 0x80;
  if (c1 & 0xc0) return -1;
  if (c0 < 0xe0) {
    if (c0 < 0xc0) return -1;
    int code = ((c0 << 6) | c1) & 0x07ff;
    if (code <= 0x7f) return -1;
    return code;
  }
  if (len <= 2) return -1;

  // Three character sequence (16-bit value).
  int c2 = *reinterpret_cast<const uint8 *>(s + 2) ^ 0x80;
  if (c2 & 0xc0) return -1;
  if (c0 < 0xf0) {
    int code = ((((c0 << 6) | c1) << 6) | c2) & 0xffff;
    if (code <= 0x07ff) return -1;
    return code;
  }
  if (len <= 3) return -1;

  // Four character sequence (21-bit value).
  int c3 = *reinterpret_cast<const uint8 *>(s + 3) ^ 0x80;
  if (c3 & 0xc0) return -1;
  if (c0 < 0xf8) {
    int code = ((((((c0 << 6) | c1) << 6) | c2) << 6) | c3) & 0x001fffff;
    if (code <= 0xffff) return -1;
    return code;
  }

  return -1;
}

int UTF8::Encode(int code, string *str) {
  uint32 c = code;

  // One character sequence.
  if (c <= 0x7f) {
    str->push_back(c);
    return 1;
  }

  // Two character sequence.
  if (c <= 0x7ff) {
    str->push_back(0xc0 | (c >> 6));
    str->push_back(0x80 | (c & 0x3f));
    return 2;
  }

  // Three character sequence.
  if (c <= 0xffff) {
    str->push_back(0xe0 | (c >> 12));
    str->push_back(0x80 | ((c >> 6) & 0x3f));
    str->push_back(0x80 | (c & 0x3f));
    return 3;
  }

  // Four character sequence.
  str->push_back(0xf0 | (c >> 18));
  str->push_back(0x80 | ((c >> 12) & 0x3f));
  str->push_back(0x80 | ((c >> 6) & 0x3f));
  str->push_back(0x80 | (c & 0x3f));
  return 4;
}

void UTF8::Lowercase(const char *s, int len, string *result) {
  // Clear output string.
  result->clear();
  result->reserve(len);

  // Try fast conversion where all characters are below 128.
  const char *end = s + len;
  while (s < end) {
    uint8 c = *reinterpret_cast<const uint8 *>(s);
    if (c & 0x80) break;
    result->push_back(Unicode::ToLower(c));
    s++;
  }

  // Handle any remaining part of the string which can contain multi-byte
  // characters. Invalid bytes are copied unchanged.
  while (s < end) {
    int n = CharLen(s);
    if (s + n > end) n = end - s;
    int code = Decode(s, n);
    if (code < 0) {
      result->push_back(*s++);
    } else {
      Encode(Unicode::ToLower(code), result);
      s += n;
    }
  }
}

}  // namespace spanlab
