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


#ifndef SPANLAB_NLP_LABELS_LABELS_H_
#define SPANLAB_NLP_LABELS_LABELS_H_

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "spanlab/base/macros.h"
#include "spanlab/base/status.h"
#include "spanlab/base/types.h"
#include "spanlab/nlp/document/corpus.h"
#include "spanlab/nlp/document/document.h"

namespace spanlab {
namespace nlp {

class Labels;

// Set of spans in natural order.
typedef std::set<Span> SpanSet;

// Named set of words. Case-insensitive dictionaries hold lower-cased words.
struct Dictionary {
  std::set<string> words;
  bool ignore_case = true;

  // Checks if word is in dictionary. Words are lower-cased before lookup in
  // case-insensitive dictionaries.
  bool Contains(const string &word) const;
};

// A layer holds the labeling of one tokenization level of the corpus: the
// instances of each declared type as well as properties of spans and tokens.
// Labels are only ever added or overwritten, never removed.
class Layer {
 public:
  Layer(Labels *labels, const string &name, Corpus *corpus, bool owned);
  ~Layer();

  // Level name.
  const string &name() const { return name_; }

  // Corpus with the tokenization for the level.
  Corpus *corpus() const { return corpus_; }

  // Label store that the layer belongs to.
  Labels *labels() const { return labels_; }

  // Declares type. Declaring a type more than once has no effect.
  void DeclareType(const string &type);

  // Adds span as an instance of a type. The type is declared if needed.
  void AddToType(const Span &span, const string &type);

  // Checks if type has been declared.
  bool IsType(const string &type) const;

  // Checks if span is an instance of type.
  bool HasType(const Span &span, const string &type) const;

  // Returns the instances of a type or null if the type is not declared.
  const SpanSet *InstancesOf(const string &type) const;

  // Returns the number of instances of a type.
  int NumInstances(const string &type) const;

  // Returns the instances of a type that start at a token in a document.
  void InstancesStartingAt(const string &type, const Document *document,
                           int begin, std::vector<Span> *spans) const;

  // Returns spans covering each document in corpus order.
  void DocumentSpans(std::vector<Span> *spans) const;

  // Returns all declared types in sorted order.
  void Types(std::vector<string> *types) const;

  // Sets and gets span properties. GetProperty() returns null if the
  // property is not set.
  void SetProperty(const Span &span, const string &key, const string &value);
  const string *GetProperty(const Span &span, const string &key) const;

  // Sets and gets token properties.
  void SetTokenProperty(const Token &token, const string &key,
                        const string &value);
  const string *GetTokenProperty(const Token &token, const string &key) const;

 private:
  typedef std::map<string, string> PropertyMap;
  typedef std::pair<int, int> TokenKey;

  static TokenKey KeyFor(const Token &token) {
    return TokenKey(token.document()->index(), token.index());
  }

  // Label store for layer.
  Labels *labels_;

  // Level name.
  string name_;

  // Tokenized corpus for level.
  Corpus *corpus_;
  bool owned_;

  // Type instances.
  std::map<string, SpanSet> types_;

  // Span and token properties.
  std::map<Span, PropertyMap> span_properties_;
  std::map<TokenKey, PropertyMap> token_properties_;

  DISALLOW_COPY_AND_ASSIGN(Layer);
};

// Label store with layers for a number of tokenization levels of a corpus,
// together with dictionaries and the set of types that have been provided by
// annotators.
class Labels {
 public:
  // Name of the base level.
  static const char kOriginalLevel[];

  // Initializes label store with corpus as the original level. The corpus is
  // not owned by the label store.
  explicit Labels(Corpus *corpus);
  ~Labels();

  // Returns the original level.
  Layer *original() const { return original_; }

  // Returns layer for level or null if the level does not exist.
  Layer *GetLayer(const string &name) const;

  // Creates a new level by retokenizing the source layer using the named
  // strategy.
  Status CreateLevel(const string &name, const string &strategy,
                     const string &pattern, const Layer &source);

  // Copies the instances of a type in a level into the target layer under a
  // new type name. Spans are mapped through their character ranges.
  Status ImportFromLevel(const string &level, const string &old_type,
                         Layer *target, const string &new_type);

  // Defines named dictionary. A later definition replaces an earlier one.
  void DefineDictionary(const string &name, const std::set<string> &words,
                        bool ignore_case);

  // Returns dictionary or null if it has not been defined.
  const Dictionary *GetDictionary(const string &name) const;

  // Checks if word is in a dictionary. Returns false if the dictionary has
  // not been defined.
  bool IsDictionaryWord(const string &name, const string &word) const;

  // Marks type as annotated.
  void SetAnnotatedBy(const string &type);

  // Checks if type has been annotated, i.e. it has been marked as annotated
  // or the layer already has instances of the type.
  bool IsAnnotatedBy(const string &type, const Layer &layer) const;

  // Makes sure that type is annotated in layer. If not, the annotator named by
  // file, or by the type if file is empty, is loaded and run on the layer.
  Status Require(const string &type, const string &file, Layer *layer);

 private:
  // Layers for tokenization levels.
  std::map<string, Layer *> layers_;
  Layer *original_;

  // Dictionaries.
  std::map<string, Dictionary> dictionaries_;

  // Types that have been marked as annotated.
  std::set<string> annotated_;

  DISALLOW_COPY_AND_ASSIGN(Labels);
};

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_LABELS_LABELS_H_
