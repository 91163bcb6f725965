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


#include "spanlab/nlp/program/generator.h"

#include <set>

#include "spanlab/base/logging.h"
#include "spanlab/nlp/labels/errors.h"
#include "spanlab/nlp/program/program-tokenizer.h"
#include "spanlab/string/strip.h"

namespace spanlab {
namespace nlp {

Status MatchGenerator::Generate(const std::vector<Span> &input,
                                const Layer &layer,
                                const Emitter &emit) const {
  std::vector<Span> extractions;
  for (const Span &span : input) {
    Status st = pattern_->Extract(layer, span, &extractions);
    if (!st.ok()) return st;
    for (const Span &extraction : extractions) emit(extraction);
  }
  return Status::OK;
}

string MatchGenerator::ToString() const {
  return ": " + pattern_->ToString();
}

Status FilterGenerator::Generate(const std::vector<Span> &input,
                                 const Layer &layer,
                                 const Emitter &emit) const {
  // Collect the rejected spans before emitting any of them.
  std::set<Span> rejected;
  for (const Span &span : input) {
    bool found;
    Status st = pattern_->HasExtraction(layer, span, &found);
    if (!st.ok()) return st;
    if (!found) rejected.insert(span);
  }

  for (const Span &span : rejected) emit(span);
  return Status::OK;
}

string FilterGenerator::ToString() const {
  return "- " + pattern_->ToString();
}

Status RegexGenerator::Init(const string &regex, int group) {
  Status st = regex_.Compile(regex);
  if (!st.ok()) return Status(PARSE_ERROR, st.message());
  if (group < 0 || group > regex_.groups()) {
    return Status(PARSE_ERROR, "no capture group " + std::to_string(group) +
                  " in '" + regex + "'");
  }
  group_ = group;
  return Status::OK;
}

Status RegexGenerator::Generate(const std::vector<Span> &input,
                                const Layer &layer,
                                const Emitter &emit) const {
  std::vector<RegExp::Match> matches;
  for (const Span &span : input) {
    regex_.FindAll(span.GetText().str(), &matches);
    for (const RegExp::Match &match : matches) {
      int lo = match.begin[group_];
      int hi = match.end[group_];
      if (lo < 0) continue;
      Span subspan;
      if (!span.CharIndexProperSubSpan(lo, hi, &subspan)) {
        VLOG(2) << "Regex match [" << lo << "," << hi << "[ in " << span
                << " is not token aligned";
        continue;
      }
      emit(subspan);
    }
  }
  return Status::OK;
}

string RegexGenerator::ToString() const {
  return "~ re " + ProgramTokenizer::Quote(regex_.pattern()) + ", " +
         std::to_string(group_);
}

void TrieGenerator::AddPhrase(const string &key,
                              const std::vector<string> &words) {
  if (words.empty()) return;
  string phrase;
  string source;
  for (const string &word : words) {
    if (!phrase.empty()) {
      phrase.push_back(' ');
      source.push_back(' ');
    }
    phrase.append(word);
    source.append(ProgramTokenizer::QuoteIfNeeded(word));
  }
  trie_.AddPhrase(key, phrase);
  phrases_.push_back(source);
}

void TrieGenerator::AddPhraseFile(const string &filename,
                                  const std::vector<string> &lines) {
  for (int i = 0; i < lines.size(); ++i) {
    string key = filename + ".line." + std::to_string(i + 1);
    trie_.AddPhrase(key, StripWhiteSpace(lines[i]));
  }
  phrases_.push_back("\"" + filename + "\"");
}

Status TrieGenerator::Generate(const std::vector<Span> &input,
                               const Layer &layer,
                               const Emitter &emit) const {
  for (const Span &span : input) trie_.Lookup(span, emit);
  return Status::OK;
}

string TrieGenerator::ToString() const {
  string str = "~ trie";
  for (int i = 0; i < phrases_.size(); ++i) {
    str.append(i == 0 ? " " : ", ");
    str.append(phrases_[i]);
  }
  return str;
}

}  // namespace nlp
}  // namespace spanlab
