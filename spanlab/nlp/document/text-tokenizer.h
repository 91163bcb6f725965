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


#ifndef SPANLAB_NLP_DOCUMENT_TEXT_TOKENIZER_H_
#define SPANLAB_NLP_DOCUMENT_TEXT_TOKENIZER_H_

#include <functional>
#include <string>
#include <vector>

#include "spanlab/base/macros.h"
#include "spanlab/base/types.h"
#include "spanlab/string/text.h"

namespace spanlab {
namespace nlp {

// Tokenizer for breaking text into tokens. A token is a maximal run of
// letters, a maximal run of digits, or a single character that is neither a
// letter, a digit, nor whitespace. Whitespace separates tokens.
class Tokenizer {
 public:
  // Tokens generated by tokenizer.
  struct Token {
    string text;
    int begin;
    int end;
  };

  // Callback for collecting the generated tokens.
  typedef std::function<void(const Token &token)> Callback;

  Tokenizer() = default;

  // Tokenizes text. The begin and end positions of the tokens are byte
  // offsets into the text.
  void Tokenize(Text text, const Callback &callback) const;

  // Tokenizes text and returns the token words.
  void Split(Text text, std::vector<string> *words) const;

 private:
  DISALLOW_COPY_AND_ASSIGN(Tokenizer);
};

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_DOCUMENT_TEXT_TOKENIZER_H_
