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


#include "spanlab/nlp/program/phrase-trie.h"

#include "spanlab/util/unicode.h"

namespace spanlab {
namespace nlp {

PhraseTrie::Node::~Node() {
  for (auto &it : children) delete it.second;
}

PhraseTrie::PhraseTrie() {}

PhraseTrie::~PhraseTrie() {}

void PhraseTrie::AddPhrase(const string &key, Text phrase) {
  std::vector<string> words;
  tokenizer_.Split(phrase, &words);
  if (words.empty()) return;

  Node *node = &root_;
  for (const string &word : words) {
    Node *&child = node->children[UTF8::Lower(word)];
    if (child == nullptr) child = new Node();
    node = child;
  }
  node->keys.push_back(key);
  size_++;
}

void PhraseTrie::Lookup(const Span &span, const Callback &callback) const {
  // Lower-case the span tokens once.
  std::vector<string> words;
  for (int i = 0; i < span.length(); ++i) {
    words.push_back(UTF8::Lower(span.token(i).word()));
  }

  for (int b = 0; b < span.length(); ++b) {
    const Node *node = &root_;
    for (int e = b; e < span.length(); ++e) {
      auto f = node->children.find(words[e]);
      if (f == node->children.end()) break;
      node = f->second;
      if (!node->keys.empty()) callback(span.SubSpan(b, e + 1));
    }
  }
}

void PhraseTrie::Find(const std::vector<string> &words,
                      std::vector<string> *keys) const {
  keys->clear();
  const Node *node = &root_;
  for (const string &word : words) {
    auto f = node->children.find(UTF8::Lower(word));
    if (f == node->children.end()) return;
    node = f->second;
  }
  if (node != &root_) *keys = node->keys;
}

}  // namespace nlp
}  // namespace spanlab
