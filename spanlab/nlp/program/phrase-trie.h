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


#ifndef SPANLAB_NLP_PROGRAM_PHRASE_TRIE_H_
#define SPANLAB_NLP_PROGRAM_PHRASE_TRIE_H_

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "spanlab/base/macros.h"
#include "spanlab/base/types.h"
#include "spanlab/nlp/document/document.h"
#include "spanlab/nlp/document/text-tokenizer.h"
#include "spanlab/string/text.h"

namespace spanlab {
namespace nlp {

// Trie of phrases over lower-cased tokens. Phrases are tokenized with the
// document tokenizer so they align with document tokens.
class PhraseTrie {
 public:
  // Callback for reporting phrase matches.
  typedef std::function<void(const Span &span)> Callback;

  PhraseTrie();
  ~PhraseTrie();

  // Adds phrase to trie. Phrases without tokens are ignored.
  void AddPhrase(const string &key, Text phrase);

  // Reports every phrase occurrence inside the span in order of start token
  // and then length. A sub-span matching several phrases is only reported
  // once.
  void Lookup(const Span &span, const Callback &callback) const;

  // Returns the keys for phrases that are equal to the words.
  void Find(const std::vector<string> &words, std::vector<string> *keys) const;

  // Returns the number of phrases in the trie.
  int size() const { return size_; }

 private:
  // Trie node with children indexed by lower-cased token.
  struct Node {
    ~Node();

    std::map<string, Node *> children;
    std::vector<string> keys;
  };

  // Root node.
  Node root_;

  // Number of phrases.
  int size_ = 0;

  // Tokenizer for phrases.
  Tokenizer tokenizer_;

  DISALLOW_COPY_AND_ASSIGN(PhraseTrie);
};

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_PROGRAM_PHRASE_TRIE_H_
