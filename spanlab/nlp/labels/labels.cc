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


#include "spanlab/nlp/labels/labels.h"

#include <string>
#include <vector>

#include "spanlab/base/logging.h"
#include "spanlab/nlp/labels/annotator.h"
#include "spanlab/nlp/labels/errors.h"
#include "spanlab/nlp/labels/retokenizer.h"
#include "spanlab/util/unicode.h"

namespace spanlab {
namespace nlp {

const char Labels::kOriginalLevel[] = "original";

bool Dictionary::Contains(const string &word) const {
  if (ignore_case) return words.count(UTF8::Lower(word)) > 0;
  return words.count(word) > 0;
}

Layer::Layer(Labels *labels, const string &name, Corpus *corpus, bool owned)
    : labels_(labels), name_(name), corpus_(corpus), owned_(owned) {}

Layer::~Layer() {
  if (owned_) delete corpus_;
}

void Layer::DeclareType(const string &type) {
  types_[type];
}

void Layer::AddToType(const Span &span, const string &type) {
  types_[type].insert(span);
}

bool Layer::IsType(const string &type) const {
  return types_.count(type) > 0;
}

bool Layer::HasType(const Span &span, const string &type) const {
  auto f = types_.find(type);
  if (f == types_.end()) return false;
  return f->second.count(span) > 0;
}

const SpanSet *Layer::InstancesOf(const string &type) const {
  auto f = types_.find(type);
  if (f == types_.end()) return nullptr;
  return &f->second;
}

int Layer::NumInstances(const string &type) const {
  auto f = types_.find(type);
  if (f == types_.end()) return 0;
  return f->second.size();
}

void Layer::InstancesStartingAt(const string &type, const Document *document,
                                int begin, std::vector<Span> *spans) const {
  spans->clear();
  auto f = types_.find(type);
  if (f == types_.end()) return;
  const SpanSet &instances = f->second;
  for (auto it = instances.lower_bound(Span(document, begin, begin));
       it != instances.end(); ++it) {
    if (it->document() != document || it->begin() != begin) break;
    spans->push_back(*it);
  }
}

void Layer::DocumentSpans(std::vector<Span> *spans) const {
  spans->clear();
  for (const Document *document : corpus_->documents()) {
    spans->push_back(document->GetSpan());
  }
}

void Layer::Types(std::vector<string> *types) const {
  types->clear();
  for (auto &it : types_) types->push_back(it.first);
}

void Layer::SetProperty(const Span &span, const string &key,
                        const string &value) {
  span_properties_[span][key] = value;
}

const string *Layer::GetProperty(const Span &span, const string &key) const {
  auto f = span_properties_.find(span);
  if (f == span_properties_.end()) return nullptr;
  auto p = f->second.find(key);
  if (p == f->second.end()) return nullptr;
  return &p->second;
}

void Layer::SetTokenProperty(const Token &token, const string &key,
                             const string &value) {
  token_properties_[KeyFor(token)][key] = value;
}

const string *Layer::GetTokenProperty(const Token &token,
                                      const string &key) const {
  auto f = token_properties_.find(KeyFor(token));
  if (f == token_properties_.end()) return nullptr;
  auto p = f->second.find(key);
  if (p == f->second.end()) return nullptr;
  return &p->second;
}

Labels::Labels(Corpus *corpus) {
  original_ = new Layer(this, kOriginalLevel, corpus, false);
  layers_[kOriginalLevel] = original_;
}

Labels::~Labels() {
  for (auto &it : layers_) delete it.second;
}

Layer *Labels::GetLayer(const string &name) const {
  auto f = layers_.find(name);
  return f == layers_.end() ? nullptr : f->second;
}

Status Labels::CreateLevel(const string &name, const string &strategy,
                           const string &pattern, const Layer &source) {
  if (layers_.count(name) > 0) {
    return ReferenceError("Level already exists: " + name);
  }
  if (!Retokenizer::IsRegistered(strategy)) {
    return ReferenceError("Unknown level strategy: " + strategy);
  }

  // Initialize retokenizer for level.
  Retokenizer *retokenizer = Retokenizer::Create(strategy);
  Status st = retokenizer->Init(pattern, source);
  if (!st.ok()) {
    delete retokenizer;
    return st;
  }

  // Retokenize all the documents in the source level.
  Corpus *corpus = new Corpus();
  for (const Document *document : source.corpus()->documents()) {
    Document *target =
        corpus->AddUntokenizedDocument(document->id(), document->text());
    retokenizer->Retokenize(source, *document, target);
  }
  delete retokenizer;

  VLOG(1) << "Created level " << name << " with strategy " << strategy;
  layers_[name] = new Layer(this, name, corpus, true);
  return Status::OK;
}

Status Labels::ImportFromLevel(const string &level, const string &old_type,
                               Layer *target, const string &new_type) {
  Layer *source = GetLayer(level);
  if (source == nullptr) return ReferenceError("Unknown level: " + level);
  const SpanSet *instances = source->InstancesOf(old_type);
  if (instances == nullptr) {
    return ReferenceError("No type '" + old_type + "' in level " + level);
  }

  // Map each instance onto the tokens of the target level.
  target->DeclareType(new_type);
  for (const Span &span : *instances) {
    int index = span.document()->index();
    if (index >= target->corpus()->size()) continue;
    const Document *document = target->corpus()->document(index);
    Span whole = document->GetSpan();
    if (whole.empty()) continue;
    int base = whole.char_begin();
    Span mapped;
    if (whole.CharIndexProperSubSpan(span.char_begin() - base,
                                     span.char_end() - base, &mapped)) {
      target->AddToType(mapped, new_type);
    }
  }
  return Status::OK;
}

void Labels::DefineDictionary(const string &name,
                              const std::set<string> &words,
                              bool ignore_case) {
  Dictionary &dictionary = dictionaries_[name];
  dictionary.words = words;
  dictionary.ignore_case = ignore_case;
}

const Dictionary *Labels::GetDictionary(const string &name) const {
  auto f = dictionaries_.find(name);
  return f == dictionaries_.end() ? nullptr : &f->second;
}

bool Labels::IsDictionaryWord(const string &name, const string &word) const {
  const Dictionary *dict = GetDictionary(name);
  return dict != nullptr && dict->Contains(word);
}

void Labels::SetAnnotatedBy(const string &type) {
  annotated_.insert(type);
}

bool Labels::IsAnnotatedBy(const string &type, const Layer &layer) const {
  return annotated_.count(type) > 0 || layer.NumInstances(type) > 0;
}

Status Labels::Require(const string &type, const string &file,
                       Layer *layer) {
  if (IsAnnotatedBy(type, *layer)) return Status::OK;

  // Load and run annotator for type.
  const string &name = file.empty() ? type : file;
  VLOG(1) << "Annotating " << type << " with " << name;
  Annotator *annotator;
  Status st = LoadAnnotator(name, &annotator);
  if (!st.ok()) return st;
  st = annotator->Annotate(layer);
  delete annotator;
  if (!st.ok()) return st;

  SetAnnotatedBy(type);
  return Status::OK;
}

}  // namespace nlp
}  // namespace spanlab
