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


#include "spanlab/nlp/program/scanner.h"

#include <string>

namespace spanlab {
namespace nlp {

Scanner::Scanner(Text input) : input_(input) {
  pos_ = 0;
  current_ = 0;
  line_ = 1;
  column_ = 0;
  token_line_ = 1;
  token_column_ = 1;
  token_ = 0;
  NextChar();
}

void Scanner::NextChar() {
  if (current_ == '\n') {
    line_++;
    column_ = 0;
  }
  if (current_ != -1 && pos_ < input_.size()) {
    current_ = static_cast<uint8>(input_[pos_++]);
    column_++;
  } else {
    current_ = -1;
  }
}

void Scanner::SetError(const string &error_message) {
  if (error_message_.empty()) error_message_ = error_message;
  token_ = ERROR;
}

int Scanner::Error(const string &error_message) {
  SetError(error_message);
  return ERROR;
}

}  // namespace nlp
}  // namespace spanlab
