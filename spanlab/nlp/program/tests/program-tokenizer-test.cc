// Copyright 2026 The spanlab Authors.
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


#include <string>
#include <vector>

#include "spanlab/base/init.h"
#include "spanlab/base/logging.h"
#include "spanlab/nlp/program/program-tokenizer.h"

using namespace spanlab;
using namespace spanlab::nlp;

typedef ProgramTokenizer PT;

// Returns the token texts for input.
std::vector<string> Tokens(const string &input) {
  std::vector<string> tokens;
  PT tokenizer(input);
  while (!tokenizer.done() && !tokenizer.error()) {
    tokens.push_back(tokenizer.token_text());
    tokenizer.NextToken();
  }
  return tokens;
}

void TestTokens() {
  PT t("defSpanType name =: 'Mr' ... [ a(first) ] || eq('x') {2,3};");
  CHECK_EQ(t.token(), PT::WORD_TOKEN);
  CHECK(t.IsWord("defSpanType"));
  CHECK_EQ(t.token_line(), 1);
  CHECK_EQ(t.token_column(), 1);
  t.NextToken();
  CHECK(t.IsWord("name"));
  CHECK_EQ(t.token_column(), 13);
  CHECK_EQ(t.NextToken(), '=');
  CHECK_EQ(t.NextToken(), ':');
  CHECK_EQ(t.NextToken(), PT::QUOTED_TOKEN);
  CHECK_EQ(t.token_text(), "'Mr'");
  CHECK_EQ(t.NextToken(), PT::ELLIPSIS_TOKEN);
  CHECK_EQ(t.token_text(), "...");
  CHECK_EQ(t.NextToken(), '[');
  CHECK(t.NextToken() == PT::WORD_TOKEN && t.IsWord("a"));
  CHECK_EQ(t.NextToken(), '(');
  CHECK(t.NextToken() == PT::WORD_TOKEN && t.IsWord("first"));
  CHECK_EQ(t.NextToken(), ')');
  CHECK_EQ(t.NextToken(), ']');
  CHECK_EQ(t.NextToken(), PT::OR_TOKEN);
  CHECK(t.NextToken() == PT::WORD_TOKEN && t.IsWord("eq"));
  CHECK_EQ(t.NextToken(), '(');
  CHECK_EQ(t.NextToken(), PT::QUOTED_TOKEN);
  CHECK_EQ(t.NextToken(), ')');
  CHECK_EQ(t.NextToken(), '{');
  CHECK(t.NextToken() == PT::WORD_TOKEN && t.IsWord("2"));
  CHECK_EQ(t.NextToken(), ',');
  CHECK(t.NextToken() == PT::WORD_TOKEN && t.IsWord("3"));
  CHECK_EQ(t.NextToken(), '}');
  CHECK_EQ(t.NextToken(), ';');
  CHECK_EQ(t.NextToken(), PT::END);
  CHECK(t.done());
}

void TestWords() {
  // Periods are part of words only between word characters.
  std::vector<string> expected = {"\"", "dict.txt", "\"", "end", "."};
  CHECK(Tokens("\"dict.txt\" end.") == expected);

  expected = {"a", ".", ".", "b"};
  CHECK(Tokens("a..b") == expected);

  expected = {"x", "|", "y"};
  CHECK(Tokens("x|y") == expected);

  expected = {"under_score", "42", "+", "case"};
  CHECK(Tokens("under_score 42 +case") == expected);
}

void TestLines() {
  PT t("first\n  second");
  t.NextToken();
  CHECK(t.IsWord("second"));
  CHECK_EQ(t.token_line(), 2);
  CHECK_EQ(t.token_column(), 3);
}

void TestQuoted() {
  PT t("'it\\'s' ''");
  CHECK_EQ(t.token(), PT::QUOTED_TOKEN);
  CHECK_EQ(t.token_text(), "'it\\'s'");
  CHECK_EQ(PT::Unquote(t.token_text()), "it's");
  CHECK_EQ(t.NextToken(), PT::QUOTED_TOKEN);
  CHECK_EQ(PT::Unquote(t.token_text()), "");

  PT unterminated("'open");
  CHECK(unterminated.error());
  CHECK(!unterminated.error_message().empty());

  CHECK_EQ(PT::Quote("it's"), "'it\\'s'");
  CHECK_EQ(PT::Unquote("plain"), "plain");
  CHECK_EQ(PT::QuoteIfNeeded("word"), "word");
  CHECK_EQ(PT::QuoteIfNeeded("two words"), "'two words'");
  CHECK_EQ(PT::QuoteIfNeeded("a-b"), "'a-b'");
  CHECK_EQ(PT::QuoteIfNeeded(""), "''");
  CHECK(PT::IsPlainWord("file.txt"));
  CHECK(!PT::IsPlainWord("file."));
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestTokens();
  TestWords();
  TestLines();
  TestQuoted();

  LOG(INFO) << "PASS";
  return 0;
}
