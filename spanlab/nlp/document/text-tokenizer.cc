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


#include "spanlab/nlp/document/text-tokenizer.h"

#include <string>
#include <vector>

#include "spanlab/util/unicode.h"

namespace spanlab {
namespace nlp {

namespace {

// Character classes for tokenization.
enum CharClass {SPACE, LETTER, DIGIT, OTHER};

// Classify the character at position and return its length in bytes.
CharClass Classify(const char *s, const char *end, int *length) {
  int n = UTF8::CharLen(s);
  if (s + n > end) n = end - s;
  *length = n;
  int code = UTF8::Decode(s, n);
  if (code < 0) {
    // Bytes outside valid sequences are single-byte symbols.
    *length = 1;
    return OTHER;
  }
  if (Unicode::IsSpace(code)) return SPACE;
  if (Unicode::IsDigit(code)) return DIGIT;
  if (Unicode::IsLetter(code)) return LETTER;
  return OTHER;
}

}  // namespace

void Tokenizer::Tokenize(Text text, const Callback &callback) const {
  const char *start = text.data();
  const char *end = start + text.size();
  const char *s = start;
  Token token;
  while (s < end) {
    int length;
    CharClass cls = Classify(s, end, &length);
    if (cls == SPACE) {
      s += length;
      continue;
    }

    // Extend letter and digit runs.
    const char *t = s + length;
    if (cls == LETTER || cls == DIGIT) {
      while (t < end) {
        int n;
        if (Classify(t, end, &n) != cls) break;
        t += n;
      }
    }

    token.text.assign(s, t - s);
    token.begin = s - start;
    token.end = t - start;
    callback(token);
    s = t;
  }
}

void Tokenizer::Split(Text text, std::vector<string> *words) const {
  words->clear();
  Tokenize(text, [words](const Token &token) {
    words->push_back(token.text);
  });
}

}  // namespace nlp
}  // namespace spanlab
