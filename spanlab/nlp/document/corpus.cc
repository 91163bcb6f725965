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


#include "spanlab/nlp/document/corpus.h"

#include <string>
#include <vector>

#include "spanlab/base/logging.h"
#include "spanlab/file/file.h"

namespace spanlab {
namespace nlp {

Corpus::~Corpus() {
  for (Document *document : documents_) delete document;
}

Document *Corpus::AddDocument(const string &id, const string &text) {
  Document *document = AddUntokenizedDocument(id, text);
  tokenizer_.Tokenize(text, [document](const Tokenizer::Token &token) {
    document->AddToken(token.begin, token.end);
  });
  return document;
}

Document *Corpus::AddUntokenizedDocument(const string &id,
                                         const string &text) {
  Document *document = new Document(id, text, documents_.size());
  documents_.push_back(document);
  return document;
}

Document *Corpus::Find(const string &id) const {
  for (Document *document : documents_) {
    if (document->id() == id) return document;
  }
  return nullptr;
}

Status Corpus::Load(const string &path) {
  FileStat stat;
  Status st = File::Stat(path, &stat);
  if (!st.ok()) return st;
  if (!stat.is_directory) return LoadFile(path);

  // Load all regular files in directory.
  std::vector<string> filenames;
  st = File::Match(path + "/*", &filenames);
  if (!st.ok()) return st;
  for (const string &filename : filenames) {
    FileStat fstat;
    st = File::Stat(filename, &fstat);
    if (!st.ok()) return st;
    if (!fstat.is_file) {
      VLOG(1) << "Skipping " << filename;
      continue;
    }
    st = LoadFile(filename);
    if (!st.ok()) {
      LOG(WARNING) << "Cannot load document " << filename << ": " << st;
    }
  }
  return Status::OK;
}

Status Corpus::LoadFile(const string &filename) {
  string text;
  Status st = File::ReadContents(filename, &text);
  if (!st.ok()) return st;
  size_t slash = filename.rfind('/');
  string id = slash == string::npos ? filename : filename.substr(slash + 1);
  Document *document = AddDocument(id, text);
  VLOG(1) << "Loaded " << id << " with " << document->num_tokens()
          << " tokens";
  return Status::OK;
}

}  // namespace nlp
}  // namespace spanlab
