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


#ifndef SPANLAB_NLP_DOCUMENT_CORPUS_H_
#define SPANLAB_NLP_DOCUMENT_CORPUS_H_

#include <string>
#include <vector>

#include "spanlab/base/macros.h"
#include "spanlab/base/status.h"
#include "spanlab/base/types.h"
#include "spanlab/nlp/document/document.h"
#include "spanlab/nlp/document/text-tokenizer.h"

namespace spanlab {
namespace nlp {

// A corpus is an ordered collection of documents. The corpus owns its
// documents.
class Corpus {
 public:
  Corpus() = default;
  ~Corpus();

  // Adds a document with text tokenized by the standard tokenizer.
  Document *AddDocument(const string &id, const string &text);

  // Adds a document without tokens.
  Document *AddUntokenizedDocument(const string &id, const string &text);

  // Loads a text file as a document, or every regular file in a directory as
  // a document. Files in a directory are loaded in name order. The document
  // id is the file name without directory.
  Status Load(const string &path);

  // Returns the number of documents in the corpus.
  int size() const { return documents_.size(); }

  // Returns document in corpus.
  Document *document(int index) const { return documents_[index]; }
  const std::vector<Document *> &documents() const { return documents_; }

  // Returns the document with an id or null if not found.
  Document *Find(const string &id) const;

 private:
  // Loads text file as document.
  Status LoadFile(const string &filename);

  // Documents in corpus.
  std::vector<Document *> documents_;

  // Standard tokenizer.
  Tokenizer tokenizer_;

  DISALLOW_COPY_AND_ASSIGN(Corpus);
};

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_DOCUMENT_CORPUS_H_
