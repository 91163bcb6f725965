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


#ifndef SPANLAB_NLP_PROGRAM_PATTERN_H_
#define SPANLAB_NLP_PROGRAM_PATTERN_H_

#include <set>
#include <string>
#include <vector>

#include "spanlab/base/macros.h"
#include "spanlab/base/status.h"
#include "spanlab/base/types.h"
#include "spanlab/nlp/document/document.h"
#include "spanlab/nlp/labels/labels.h"
#include "spanlab/nlp/program/program-tokenizer.h"
#include "spanlab/util/regexp.h"

namespace spanlab {
namespace nlp {

// Test on a single token.
struct TokenTest {
  enum Type {
    ANY,           // any
    EQ,            // 'lit' or eq('lit')
    EQI,           // eqi('lit')
    REGEX,         // re('regex')
    IN_DICT,       // a(dict)
    IN_DICT_LOWER, // ai(dict)
    PROPERTY_EQ,   // prop:value
    HAS_PROPERTY,  // prop
    NOT,           // !test
    AND,           // <test, test, ...>
  };

  explicit TokenTest(Type t) : type(t) {}
  ~TokenTest();

  // Checks if token satisfies the test. The dictionaries used by the test
  // must be defined.
  bool Matches(const Layer &layer, const Token &token) const;

  // Returns the first dictionary used by the test that is not defined or null
  // if all dictionaries are defined.
  const string *UndefinedDictionary(const Labels &labels) const;

  Type type;
  string name;                   // literal, dictionary, or property name
  string value;                  // property value
  RegExp regex;                  // regular expression for REGEX
  std::vector<TokenTest *> args; // sub-tests for NOT and AND

  DISALLOW_COPY_AND_ASSIGN(TokenTest);
};

// A pattern is a disjunction of token sequence expressions. A sequence must
// match the whole input span. Brackets in the sequence delimit the extracted
// sub-span; without brackets the whole span is extracted.
//
//   PATTERN := SEQ ('||' SEQ)*
//   SEQ     := ITEM+
//   ITEM    := '...' | '[' | ']' | '@' TYPE ['?'] | ['L'] TEST [REPEAT] ['R']
//   REPEAT  := '*' | '+' | '?' | '{' N '}' | '{' N ',' '}' | '{' N ',' M '}'
//   TEST    := 'any' | 'lit' | eq('lit') | eqi('lit') | re('regex') |
//              a(DICT) | ai(DICT) | PROP ':' VALUE | PROP | '!' TEST |
//              '<' TEST (',' TEST)* '>'
//
// The L flag requires that the token before the run does not satisfy the test
// and the R flag requires that the token after the run does not satisfy the
// test, i.e. the run is maximal on that side.
class Pattern {
 public:
  Pattern() = default;
  ~Pattern();

  // Parses pattern from the input tokens up to the end of the statement. On
  // errors, the input is positioned at the offending token.
  Status Parse(ProgramTokenizer *input);

  // Extracts the sub-spans of a span matched by the pattern. The results are
  // distinct spans in natural order.
  Status Extract(const Layer &layer, const Span &span,
                 std::vector<Span> *results) const;

  // Checks if the pattern has any extraction from the span.
  Status HasExtraction(const Layer &layer, const Span &span,
                       bool *found) const;

  // Returns pattern in source form.
  string ToString() const;

 private:
  // Pattern sequence item.
  struct Item {
    enum Type {ELLIPSIS, OPEN, CLOSE, INSTANCE, TEST};
    Type type;
    string name;              // type name for INSTANCE
    bool optional = false;    // optional instance
    TokenTest *test = nullptr;
    int min = 1;              // minimum repeat count
    int max = 1;              // maximum repeat count, -1 for unbounded
    bool left = false;        // L flag
    bool right = false;       // R flag
  };

  // Sequence of items.
  typedef std::vector<Item> Sequence;

  // Match state with position and bracket positions.
  struct State {
    int pos;
    int open;
    int close;
    bool operator<(const State &other) const {
      if (pos != other.pos) return pos < other.pos;
      if (open != other.open) return open < other.open;
      return close < other.close;
    }
  };

  // Parsing of pattern parts.
  Status ParseSequence(ProgramTokenizer *input, Sequence *sequence);
  Status ParseTest(ProgramTokenizer *input, TokenTest **test);
  Status ParseRepeat(ProgramTokenizer *input, Item *item);
  Status ParseProperty(const string &name, ProgramTokenizer *input,
                       TokenTest **test);

  // Reads next token and records the source text.
  void Next(ProgramTokenizer *input);

  // Matches sequence against span and adds extracted spans to results.
  void Match(const Sequence &sequence, const Layer &layer, const Span &span,
             std::set<Span> *results) const;

  // Checks if the token at a position satisfies a test.
  static bool Test(const TokenTest *test, const Layer &layer,
                   const Document *document, int pos) {
    return test->Matches(layer, document->token(pos));
  }

  // Alternative sequences.
  std::vector<Sequence> alternatives_;

  // Source tokens for pattern.
  std::vector<string> source_;

  DISALLOW_COPY_AND_ASSIGN(Pattern);
};

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_PROGRAM_PATTERN_H_
