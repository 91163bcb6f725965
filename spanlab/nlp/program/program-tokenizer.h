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


#ifndef SPANLAB_NLP_PROGRAM_PROGRAM_TOKENIZER_H_
#define SPANLAB_NLP_PROGRAM_PROGRAM_TOKENIZER_H_

#include <string>

#include "spanlab/base/types.h"
#include "spanlab/nlp/program/scanner.h"
#include "spanlab/string/text.h"

namespace spanlab {
namespace nlp {

// Tokenizer for labeling programs. Besides single-character tokens it
// produces the following tokens:
//   word      letters, digits, underscores, and non-ASCII characters, with
//             inner periods, e.g. title, 1, dict.txt
//   quoted    single-quoted string where \' escapes a quote, e.g. 'a\'b'; the
//             token text includes the quotes
//   ellipsis  ...
//   or        ||
class ProgramTokenizer : public Scanner {
 public:
  // Token types.
  enum TokenType {
    WORD_TOKEN = FIRST_AVAILABLE_TOKEN_TYPE,
    QUOTED_TOKEN,
    ELLIPSIS_TOKEN,
    OR_TOKEN,
  };

  // Initializes tokenizer with input and reads the first token.
  explicit ProgramTokenizer(Text input);

  // Reads the next input token.
  int NextToken();

  // Checks if the current token is a word with the text.
  bool IsWord(const char *word) const {
    return token_ == WORD_TOKEN && token_text_ == word;
  }

  // Checks if string is a single word token.
  static bool IsPlainWord(const string &str);

  // Removes quotes and escapes from quoted token text. Text that is not
  // quoted is returned unchanged.
  static string Unquote(const string &str);

  // Returns quoted string with escaped quotes.
  static string Quote(const string &str);

  // Returns string quoted unless it is a plain word.
  static string QuoteIfNeeded(const string &str) {
    return IsPlainWord(str) ? str : Quote(str);
  }

 private:
  // Checks if character can start or continue a word.
  static bool IsWordStart(int ch);
  static bool IsWordChar(int ch) { return IsWordStart(ch); }

  // Parses word from input.
  int ParseWord();

  // Parses single-quoted string from input.
  int ParseQuoted();
};

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_PROGRAM_PROGRAM_TOKENIZER_H_
