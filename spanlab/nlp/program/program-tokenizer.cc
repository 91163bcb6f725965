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


#include "spanlab/nlp/program/program-tokenizer.h"

#include <string>

namespace spanlab {
namespace nlp {

ProgramTokenizer::ProgramTokenizer(Text input) : Scanner(input) {
  NextToken();
}

bool ProgramTokenizer::IsWordStart(int ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
         (ch >= '0' && ch <= '9') || ch == '_' || ch >= 0x80;
}

int ProgramTokenizer::NextToken() {
  // Skip whitespace.
  while (current_ == ' ' || current_ == '\t' || current_ == '\n' ||
         current_ == '\r' || current_ == '\f' || current_ == '\v') {
    NextChar();
  }

  StartToken();

  // Check for end of input.
  if (current_ == -1) return Token(END);

  // Parse next token.
  switch (current_) {
    case '\'':
      return ParseQuoted();

    case '.':
      NextChar();
      if (current_ == '.' && Peek() == '.') {
        NextChar();
        NextChar();
        token_text_ = "...";
        return Token(ELLIPSIS_TOKEN);
      }
      Append('.');
      return Token('.');

    case '|':
      NextChar();
      if (current_ == '|') {
        NextChar();
        token_text_ = "||";
        return Token(OR_TOKEN);
      }
      Append('|');
      return Token('|');

    default:
      if (IsWordStart(current_)) return ParseWord();
      return Select(current_);
  }
}

int ProgramTokenizer::ParseWord() {
  while (current_ != -1) {
    if (IsWordChar(current_)) {
      Append(current_);
      NextChar();
    } else if (current_ == '.' && Peek() != -1 && IsWordChar(Peek())) {
      // Periods are allowed inside words.
      Append(current_);
      NextChar();
    } else {
      break;
    }
  }
  return Token(WORD_TOKEN);
}

int ProgramTokenizer::ParseQuoted() {
  // Skip start quote.
  Append(current_);
  NextChar();

  // Read until end quote.
  for (;;) {
    if (current_ == -1 || current_ == '\n') {
      return Error("Unterminated string");
    } else if (current_ == '\'') {
      Append(current_);
      NextChar();
      break;
    } else if (current_ == '\\' && Peek() == '\'') {
      Append(current_);
      NextChar();
      Append(current_);
      NextChar();
    } else {
      Append(current_);
      NextChar();
    }
  }

  return Token(QUOTED_TOKEN);
}

bool ProgramTokenizer::IsPlainWord(const string &str) {
  if (str.empty()) return false;
  ProgramTokenizer tokenizer(str);
  if (tokenizer.token() != WORD_TOKEN) return false;
  if (tokenizer.token_text() != str) return false;
  return tokenizer.NextToken() == END;
}

string ProgramTokenizer::Unquote(const string &str) {
  if (str.size() < 2 || str.front() != '\'' || str.back() != '\'') {
    return str;
  }
  string result;
  for (size_t i = 1; i < str.size() - 1; ++i) {
    if (str[i] == '\\' && i + 1 < str.size() - 1 && str[i + 1] == '\'') {
      result.push_back('\'');
      i++;
    } else {
      result.push_back(str[i]);
    }
  }
  return result;
}

string ProgramTokenizer::Quote(const string &str) {
  string result = "'";
  for (char c : str) {
    if (c == '\'') result.push_back('\\');
    result.push_back(c);
  }
  result.push_back('\'');
  return result;
}

}  // namespace nlp
}  // namespace spanlab
