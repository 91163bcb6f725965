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


#include "spanlab/nlp/labels/retokenizer.h"

#include <string>
#include <vector>

#include "spanlab/base/logging.h"
#include "spanlab/nlp/labels/errors.h"
#include "spanlab/nlp/labels/labels.h"
#include "spanlab/string/strip.h"
#include "spanlab/util/regexp.h"

REGISTER_COMPONENT_REGISTRY("retokenizer", spanlab::nlp::Retokenizer);

namespace spanlab {
namespace nlp {

// Base class for retokenizers driven by a regular expression.
class RegexRetokenizer : public Retokenizer {
 public:
  Status Init(const string &pattern, const Layer &source) override {
    Status st = regex_.Compile(pattern);
    if (!st.ok()) return Status(PARSE_ERROR, st.message());
    return Status::OK;
  }

 protected:
  RegExp regex_;
};

// Every match of the regular expression becomes a token.
class MatchRetokenizer : public RegexRetokenizer {
 public:
  void Retokenize(const Layer &source, const Document &document,
                  Document *target) override {
    std::vector<RegExp::Match> matches;
    regex_.FindAll(document.text(), &matches);
    for (const RegExp::Match &m : matches) {
      if (m.end[0] > m.begin[0]) target->AddToken(m.begin[0], m.end[0]);
    }
  }
};

REGISTER_RETOKENIZER("re", MatchRetokenizer);

// The text between matches of the regular expression becomes tokens. Tokens
// are trimmed and empty tokens are dropped.
class SplitRetokenizer : public RegexRetokenizer {
 public:
  void Retokenize(const Layer &source, const Document &document,
                  Document *target) override {
    std::vector<RegExp::Match> matches;
    regex_.FindAll(document.text(), &matches);
    int start = 0;
    for (const RegExp::Match &m : matches) {
      AddPiece(document, start, m.begin[0], target);
      start = m.end[0];
    }
    AddPiece(document, start, document.text().size(), target);
  }

 private:
  static void AddPiece(const Document &document, int begin, int end,
                       Document *target) {
    if (end <= begin) return;
    Text piece = document.GetText(begin, end);
    Text stripped = StripWhiteSpace(piece);
    if (stripped.empty()) return;
    int offset = stripped.data() - document.text().data();
    target->AddToken(offset, offset + stripped.size());
  }
};

REGISTER_RETOKENIZER("split", SplitRetokenizer);

// Source tokens that fully match the regular expression are removed.
class FilterRetokenizer : public RegexRetokenizer {
 public:
  void Retokenize(const Layer &source, const Document &document,
                  Document *target) override {
    for (const Token &token : document.tokens()) {
      if (regex_.FullMatch(token.word())) continue;
      target->AddToken(token.begin(), token.end());
    }
  }
};

REGISTER_RETOKENIZER("filter", FilterRetokenizer);

// Each instance of a type in the source level becomes a single token. Tokens
// outside the instances are kept. Instances are selected left to right and an
// instance that overlaps an earlier selected instance is skipped. Of two
// instances starting at the same token the longer one is selected.
class PseudoTokenRetokenizer : public Retokenizer {
 public:
  Status Init(const string &pattern, const Layer &source) override {
    if (!source.IsType(pattern)) {
      return ReferenceError("No type '" + pattern + "' for pseudotokens");
    }
    type_ = pattern;
    return Status::OK;
  }

  void Retokenize(const Layer &source, const Document &document,
                  Document *target) override {
    std::vector<Span> instances;
    int i = 0;
    while (i < document.num_tokens()) {
      source.InstancesStartingAt(type_, &document, i, &instances);
      int end = i;
      for (const Span &span : instances) {
        if (span.end() > end) end = span.end();
      }
      if (end > i) {
        target->AddToken(document.token(i).begin(),
                         document.token(end - 1).end());
        i = end;
      } else {
        const Token &token = document.token(i);
        target->AddToken(token.begin(), token.end());
        i++;
      }
    }
  }

 private:
  string type_;
};

REGISTER_RETOKENIZER("pseudotoken", PseudoTokenRetokenizer);

}  // namespace nlp
}  // namespace spanlab
