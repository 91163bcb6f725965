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


#include "spanlab/nlp/program/pattern.h"

#include "spanlab/base/logging.h"
#include "spanlab/nlp/labels/errors.h"
#include "spanlab/string/numbers.h"
#include "spanlab/util/unicode.h"

namespace spanlab {
namespace nlp {

TokenTest::~TokenTest() {
  for (TokenTest *arg : args) delete arg;
}

bool TokenTest::Matches(const Layer &layer, const Token &token) const {
  switch (type) {
    case ANY:
      return true;
    case EQ:
      return token.word() == name;
    case EQI:
      return UTF8::Lower(token.word()) == name;
    case REGEX:
      return regex.FullMatch(token.word());
    case IN_DICT:
      return layer.labels()->IsDictionaryWord(name, token.word());
    case IN_DICT_LOWER:
      return layer.labels()->IsDictionaryWord(name, UTF8::Lower(token.word()));
    case PROPERTY_EQ: {
      const string *prop = layer.GetTokenProperty(token, name);
      return prop != nullptr && *prop == value;
    }
    case HAS_PROPERTY:
      return layer.GetTokenProperty(token, name) != nullptr;
    case NOT:
      return !args[0]->Matches(layer, token);
    case AND:
      for (const TokenTest *arg : args) {
        if (!arg->Matches(layer, token)) return false;
      }
      return true;
  }
  return false;
}

const string *TokenTest::UndefinedDictionary(const Labels &labels) const {
  if (type == IN_DICT || type == IN_DICT_LOWER) {
    if (labels.GetDictionary(name) == nullptr) return &name;
  }
  for (const TokenTest *arg : args) {
    const string *undefined = arg->UndefinedDictionary(labels);
    if (undefined != nullptr) return undefined;
  }
  return nullptr;
}

Pattern::~Pattern() {
  for (Sequence &sequence : alternatives_) {
    for (Item &item : sequence) delete item.test;
  }
}

void Pattern::Next(ProgramTokenizer *input) {
  source_.push_back(input->token_text());
  input->NextToken();
}

Status Pattern::Parse(ProgramTokenizer *input) {
  for (;;) {
    alternatives_.emplace_back();
    Status st = ParseSequence(input, &alternatives_.back());
    if (!st.ok()) return st;
    if (input->token() != ProgramTokenizer::OR_TOKEN) break;
    Next(input);
  }
  return Status::OK;
}

// Checks if the current token can start a token test.
static bool IsTestStart(const ProgramTokenizer &input) {
  int t = input.token();
  return t == ProgramTokenizer::WORD_TOKEN ||
         t == ProgramTokenizer::QUOTED_TOKEN ||
         t == '!' || t == '<';
}

Status Pattern::ParseSequence(ProgramTokenizer *input, Sequence *sequence) {
  bool opened = false;
  bool closed = false;
  for (;;) {
    int t = input->token();
    if (t == ';' || t == Scanner::END || t == ProgramTokenizer::OR_TOKEN) {
      break;
    }
    if (t == Scanner::ERROR) {
      return Status(PARSE_ERROR, input->error_message());
    }

    Item item;
    if (t == ProgramTokenizer::ELLIPSIS_TOKEN) {
      item.type = Item::ELLIPSIS;
      Next(input);
    } else if (t == '[') {
      if (opened) return Status(PARSE_ERROR, "only one '[' allowed");
      item.type = Item::OPEN;
      opened = true;
      Next(input);
    } else if (t == ']') {
      if (!opened || closed) return Status(PARSE_ERROR, "unmatched ']'");
      item.type = Item::CLOSE;
      closed = true;
      Next(input);
    } else if (t == '@') {
      Next(input);
      if (input->token() != ProgramTokenizer::WORD_TOKEN &&
          input->token() != ProgramTokenizer::QUOTED_TOKEN) {
        return Status(PARSE_ERROR, "type name expected after '@'");
      }
      item.type = Item::INSTANCE;
      item.name = ProgramTokenizer::Unquote(input->token_text());
      Next(input);
      if (input->token() == '?') {
        item.optional = true;
        Next(input);
      }
    } else {
      item.type = Item::TEST;
      TokenTest *test = nullptr;
      if (input->IsWord("L")) {
        Next(input);
        if (IsTestStart(*input)) {
          item.left = true;
          Status st = ParseTest(input, &test);
          if (!st.ok()) return st;
        } else {
          // L without a following test is a property name.
          Status st = ParseProperty("L", input, &test);
          if (!st.ok()) return st;
        }
      } else {
        Status st = ParseTest(input, &test);
        if (!st.ok()) return st;
      }
      item.test = test;
      Status st = ParseRepeat(input, &item);
      if (!st.ok()) {
        delete test;
        return st;
      }
      if (input->IsWord("R")) {
        item.right = true;
        Next(input);
      }
    }
    sequence->push_back(item);
  }

  if (sequence->empty()) return Status(PARSE_ERROR, "empty pattern");
  if (opened && !closed) return Status(PARSE_ERROR, "missing ']'");
  return Status::OK;
}

// Parses quoted argument of a test function, e.g. eq('x').
static Status ParseArgument(ProgramTokenizer *input, bool word_allowed,
                            string *arg) {
  if (input->token() == ProgramTokenizer::QUOTED_TOKEN ||
      (word_allowed && input->token() == ProgramTokenizer::WORD_TOKEN)) {
    *arg = ProgramTokenizer::Unquote(input->token_text());
    return Status::OK;
  }
  return Status(PARSE_ERROR, "test argument expected");
}

Status Pattern::ParseTest(ProgramTokenizer *input, TokenTest **test) {
  *test = nullptr;
  int t = input->token();
  if (t == ProgramTokenizer::QUOTED_TOKEN) {
    TokenTest *eq = new TokenTest(TokenTest::EQ);
    eq->name = ProgramTokenizer::Unquote(input->token_text());
    Next(input);
    *test = eq;
    return Status::OK;
  }

  if (t == '!') {
    Next(input);
    TokenTest *arg;
    Status st = ParseTest(input, &arg);
    if (!st.ok()) return st;
    TokenTest *negation = new TokenTest(TokenTest::NOT);
    negation->args.push_back(arg);
    *test = negation;
    return Status::OK;
  }

  if (t == '<') {
    Next(input);
    TokenTest *conjunction = new TokenTest(TokenTest::AND);
    for (;;) {
      TokenTest *arg;
      Status st = ParseTest(input, &arg);
      if (!st.ok()) {
        delete conjunction;
        return st;
      }
      conjunction->args.push_back(arg);
      if (input->token() == '>') break;
      if (input->token() != ',') {
        delete conjunction;
        return Status(PARSE_ERROR, "',' or '>' expected in conjunction");
      }
      Next(input);
    }
    Next(input);
    *test = conjunction;
    return Status::OK;
  }

  if (t != ProgramTokenizer::WORD_TOKEN) {
    return Status(PARSE_ERROR, "token test expected");
  }

  string name = input->token_text();
  Next(input);
  if (name == "any") {
    *test = new TokenTest(TokenTest::ANY);
    return Status::OK;
  }

  if (input->token() == '(') {
    TokenTest::Type type;
    if (name == "eq") {
      type = TokenTest::EQ;
    } else if (name == "eqi") {
      type = TokenTest::EQI;
    } else if (name == "re") {
      type = TokenTest::REGEX;
    } else if (name == "a") {
      type = TokenTest::IN_DICT;
    } else if (name == "ai") {
      type = TokenTest::IN_DICT_LOWER;
    } else {
      return Status(PARSE_ERROR, "unknown test function", name.c_str());
    }
    Next(input);

    string arg;
    bool dict = type == TokenTest::IN_DICT || type == TokenTest::IN_DICT_LOWER;
    Status st = ParseArgument(input, dict, &arg);
    if (!st.ok()) return st;
    Next(input);
    if (input->token() != ')') return Status(PARSE_ERROR, "')' expected");
    Next(input);

    TokenTest *fn = new TokenTest(type);
    if (type == TokenTest::EQI) {
      fn->name = UTF8::Lower(arg);
    } else if (type == TokenTest::REGEX) {
      fn->name = arg;
      st = fn->regex.Compile(arg);
      if (!st.ok()) {
        delete fn;
        return Status(PARSE_ERROR, st.message());
      }
    } else {
      fn->name = arg;
    }
    *test = fn;
    return Status::OK;
  }

  return ParseProperty(name, input, test);
}

Status Pattern::ParseProperty(const string &name, ProgramTokenizer *input,
                              TokenTest **test) {
  if (input->token() == ':') {
    Next(input);
    string value;
    Status st = ParseArgument(input, true, &value);
    if (!st.ok()) return Status(PARSE_ERROR, "property value expected");
    Next(input);
    TokenTest *prop = new TokenTest(TokenTest::PROPERTY_EQ);
    prop->name = name;
    prop->value = value;
    *test = prop;
    return Status::OK;
  }

  TokenTest *prop = new TokenTest(TokenTest::HAS_PROPERTY);
  prop->name = name;
  *test = prop;
  return Status::OK;
}

// Parses a non-negative repeat count.
static bool ParseCount(const ProgramTokenizer &input, int *count) {
  int32 value;
  if (input.token() != ProgramTokenizer::WORD_TOKEN) return false;
  if (!safe_strto32(input.token_text(), &value)) return false;
  if (value < 0) return false;
  *count = value;
  return true;
}

Status Pattern::ParseRepeat(ProgramTokenizer *input, Item *item) {
  switch (input->token()) {
    case '*':
      item->min = 0;
      item->max = -1;
      Next(input);
      break;
    case '+':
      item->min = 1;
      item->max = -1;
      Next(input);
      break;
    case '?':
      item->min = 0;
      item->max = 1;
      Next(input);
      break;
    case '{': {
      Next(input);
      if (!ParseCount(*input, &item->min)) {
        return Status(PARSE_ERROR, "repeat count expected");
      }
      item->max = item->min;
      Next(input);
      if (input->token() == ',') {
        Next(input);
        if (input->token() == '}') {
          item->max = -1;
        } else {
          if (!ParseCount(*input, &item->max)) {
            return Status(PARSE_ERROR, "repeat count expected");
          }
          if (item->max < item->min) {
            return Status(PARSE_ERROR, "invalid repeat range");
          }
          Next(input);
        }
      }
      if (input->token() != '}') return Status(PARSE_ERROR, "'}' expected");
      Next(input);
      break;
    }
  }
  return Status::OK;
}

void Pattern::Match(const Sequence &sequence, const Layer &layer,
                    const Span &span, std::set<Span> *results) const {
  const Document *document = span.document();
  int begin = span.begin();
  int end = span.end();

  std::set<State> states;
  states.insert(State{begin, -1, -1});
  std::vector<Span> instances;
  for (const Item &item : sequence) {
    std::set<State> next;
    for (const State &s : states) {
      switch (item.type) {
        case Item::ELLIPSIS:
          for (int p = s.pos; p <= end; ++p) {
            next.insert(State{p, s.open, s.close});
          }
          break;

        case Item::OPEN:
          next.insert(State{s.pos, s.pos, s.close});
          break;

        case Item::CLOSE:
          next.insert(State{s.pos, s.open, s.pos});
          break;

        case Item::INSTANCE:
          if (item.optional) next.insert(s);
          instances.clear();
          layer.InstancesStartingAt(item.name, document, s.pos, &instances);
          for (const Span &instance : instances) {
            if (instance.end() <= end) {
              next.insert(State{instance.end(), s.open, s.close});
            }
          }
          break;

        case Item::TEST: {
          if (item.left && s.pos > begin &&
              Test(item.test, layer, document, s.pos - 1)) {
            break;
          }
          int run = 0;
          while (s.pos + run < end && (item.max == -1 || run < item.max) &&
                 Test(item.test, layer, document, s.pos + run)) {
            run++;
          }
          for (int k = item.min; k <= run; ++k) {
            int p = s.pos + k;
            if (item.right && p < end && Test(item.test, layer, document, p)) {
              continue;
            }
            next.insert(State{p, s.open, s.close});
          }
          break;
        }
      }
    }
    states.swap(next);
    if (states.empty()) return;
  }

  for (const State &s : states) {
    if (s.pos != end) continue;
    if (s.open >= 0 && s.close >= 0) {
      results->insert(Span(document, s.open, s.close));
    } else {
      results->insert(span);
    }
  }
}

Status Pattern::Extract(const Layer &layer, const Span &span,
                        std::vector<Span> *results) const {
  for (const Sequence &sequence : alternatives_) {
    for (const Item &item : sequence) {
      if (item.test == nullptr) continue;
      const string *dict = item.test->UndefinedDictionary(*layer.labels());
      if (dict != nullptr) {
        return ReferenceError("undefined dictionary '" + *dict + "'");
      }
    }
  }

  std::set<Span> matches;
  for (const Sequence &sequence : alternatives_) {
    Match(sequence, layer, span, &matches);
  }
  results->assign(matches.begin(), matches.end());
  return Status::OK;
}

Status Pattern::HasExtraction(const Layer &layer, const Span &span,
                              bool *found) const {
  std::vector<Span> results;
  Status st = Extract(layer, span, &results);
  if (!st.ok()) return st;
  *found = !results.empty();
  return Status::OK;
}

string Pattern::ToString() const {
  string str;
  for (const string &token : source_) {
    if (!str.empty()) str.push_back(' ');
    str.append(token);
  }
  return str;
}

}  // namespace nlp
}  // namespace spanlab
