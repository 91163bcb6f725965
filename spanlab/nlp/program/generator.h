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


#ifndef SPANLAB_NLP_PROGRAM_GENERATOR_H_
#define SPANLAB_NLP_PROGRAM_GENERATOR_H_

#include <functional>
#include <string>
#include <vector>

#include "spanlab/base/macros.h"
#include "spanlab/base/status.h"
#include "spanlab/base/types.h"
#include "spanlab/nlp/document/document.h"
#include "spanlab/nlp/labels/labels.h"
#include "spanlab/nlp/program/pattern.h"
#include "spanlab/nlp/program/phrase-trie.h"
#include "spanlab/util/regexp.h"

namespace spanlab {
namespace nlp {

// A generator produces output spans from a sequence of input spans. Output
// spans are passed to an emitter which applies them to the label store.
class Generator {
 public:
  // Generator kinds.
  enum Kind {MATCH, FILTER, REGEX, TRIE};

  // Callback for applying output spans.
  typedef std::function<void(const Span &span)> Emitter;

  virtual ~Generator() = default;

  // Returns generator kind.
  virtual Kind kind() const = 0;

  // Runs generator on the input spans. The layer is the current level of the
  // label store and may be changed by the emitter while generating.
  virtual Status Generate(const std::vector<Span> &input, const Layer &layer,
                          const Emitter &emit) const = 0;

  // Returns generator in source form.
  virtual string ToString() const = 0;
};

// Emits the extractions of a pattern from each input span. The spans are
// emitted as soon as they are found, so labels added for earlier input spans
// are visible to the matching of later ones.
class MatchGenerator : public Generator {
 public:
  // Takes ownership of pattern.
  explicit MatchGenerator(Pattern *pattern) : pattern_(pattern) {}
  ~MatchGenerator() override { delete pattern_; }

  Kind kind() const override { return MATCH; }
  Status Generate(const std::vector<Span> &input, const Layer &layer,
                  const Emitter &emit) const override;
  string ToString() const override;

 private:
  Pattern *pattern_;

  DISALLOW_COPY_AND_ASSIGN(MatchGenerator);
};

// Emits the input spans that the pattern has no extraction from. All input
// spans are tested before any span is emitted.
class FilterGenerator : public Generator {
 public:
  // Takes ownership of pattern.
  explicit FilterGenerator(Pattern *pattern) : pattern_(pattern) {}
  ~FilterGenerator() override { delete pattern_; }

  Kind kind() const override { return FILTER; }
  Status Generate(const std::vector<Span> &input, const Layer &layer,
                  const Emitter &emit) const override;
  string ToString() const override;

 private:
  Pattern *pattern_;

  DISALLOW_COPY_AND_ASSIGN(FilterGenerator);
};

// Emits the token-aligned sub-spans for a capture group of every regular
// expression match in the text of each input span. Matches that do not
// properly contain any token are skipped.
class RegexGenerator : public Generator {
 public:
  RegexGenerator() = default;

  // Compiles regular expression and checks the capture group.
  Status Init(const string &regex, int group);

  Kind kind() const override { return REGEX; }
  Status Generate(const std::vector<Span> &input, const Layer &layer,
                  const Emitter &emit) const override;
  string ToString() const override;

  const RegExp &regex() const { return regex_; }
  int group() const { return group_; }

 private:
  RegExp regex_;
  int group_ = 0;

  DISALLOW_COPY_AND_ASSIGN(RegexGenerator);
};

// Emits the occurrences of trie phrases in each input span.
class TrieGenerator : public Generator {
 public:
  TrieGenerator() = default;

  // Adds inline phrase. The phrase is given as a sequence of words.
  void AddPhrase(const string &key, const std::vector<string> &words);

  // Adds the lines of a phrase file. The file name is kept for the source
  // form of the generator.
  void AddPhraseFile(const string &filename,
                     const std::vector<string> &lines);

  Kind kind() const override { return TRIE; }
  Status Generate(const std::vector<Span> &input, const Layer &layer,
                  const Emitter &emit) const override;
  string ToString() const override;

  const PhraseTrie &trie() const { return trie_; }

 private:
  // Phrase trie.
  PhraseTrie trie_;

  // Phrases in source form.
  std::vector<string> phrases_;

  DISALLOW_COPY_AND_ASSIGN(TrieGenerator);
};

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_PROGRAM_GENERATOR_H_
