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


#ifndef SPANLAB_NLP_PROGRAM_SCANNER_H_
#define SPANLAB_NLP_PROGRAM_SCANNER_H_

#include <string>

#include "spanlab/base/types.h"
#include "spanlab/string/text.h"

namespace spanlab {
namespace nlp {

// Base scanner chunking the input into tokens.
class Scanner {
 public:
  // Token types in the range 0-255 are used for single-character tokens.
  enum ScannerTokenType {
    ERROR = 256,
    END,
    FIRST_AVAILABLE_TOKEN_TYPE
  };

  // Initializes scanner with input. The input must outlive the scanner.
  explicit Scanner(Text input);

  // Checks if all input has been read.
  bool done() const { return token_ == END; }

  // Returns true if errors were found while scanning input.
  bool error() const { return token_ == ERROR; }

  // Returns current line and column.
  int line() const { return line_; }
  int column() const { return column_; }

  // Returns line and column where the current token started.
  int token_line() const { return token_line_; }
  int token_column() const { return token_column_; }

  // Returns last error message.
  const string &error_message() const { return error_message_; }

  // Returns current input token.
  int token() const { return token_; }

  // Returns token text.
  const string &token_text() const { return token_text_; }

  // Records error at current input position.
  void SetError(const string &error_message);

  // Records error and returns the ERROR token.
  int Error(const string &error_message);

 protected:
  // Gets the next input character.
  void NextChar();

  // Returns the input character after the current one or -1 at the end.
  int Peek() const {
    return pos_ < input_.size() ? static_cast<uint8>(input_[pos_]) : -1;
  }

  // Marks the start of a new token at the current position.
  void StartToken() {
    token_text_.clear();
    token_line_ = line_;
    token_column_ = column_;
  }

  // Sets current token and returns it.
  int Token(int token) { token_ = token; return token; }

  // Consumes current input character and returns token.
  int Select(int token) { Append(current_); NextChar(); return Token(token); }

  // Adds character to token buffer.
  void Append(char ch) { token_text_.push_back(ch); }

  // Input text.
  Text input_;

  // Position of the next input character.
  ssize_t pos_;

  // Current input character or -1 if end of input has been reached.
  int current_;

  // Current position in input.
  int line_;
  int column_;

  // Position of the current token.
  int token_line_;
  int token_column_;

  // Last read token type. This is either a single-character token or one of
  // the values from the token type enumeration.
  int token_;

  // Text for last read token.
  string token_text_;

  // Last error message.
  string error_message_;
};

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_PROGRAM_SCANNER_H_
