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


#ifndef SPANLAB_NLP_LABELS_ANNOTATOR_H_
#define SPANLAB_NLP_LABELS_ANNOTATOR_H_

#include <string>

#include "spanlab/base/registry.h"
#include "spanlab/base/status.h"
#include "spanlab/base/types.h"

namespace spanlab {
namespace nlp {

class Layer;

// An annotator adds labels to a layer.
class Annotator : public Component<Annotator> {
 public:
  virtual ~Annotator() = default;

  // Annotates layer.
  virtual Status Annotate(Layer *layer) = 0;
};

#define REGISTER_ANNOTATOR(type, component) \
  REGISTER_COMPONENT_TYPE(spanlab::nlp::Annotator, type, component)

// An annotator loader creates annotators from resource files.
class AnnotatorLoader : public Singleton<AnnotatorLoader> {
 public:
  virtual ~AnnotatorLoader() = default;

  // Checks if the loader can load annotators from file.
  virtual bool Accepts(const string &filename) = 0;

  // Loads annotator from file. The caller takes ownership of the annotator.
  virtual Status Load(const string &filename, Annotator **annotator) = 0;
};

#define REGISTER_ANNOTATOR_LOADER(type, component) \
  REGISTER_SINGLETON_TYPE(spanlab::nlp::AnnotatorLoader, type, component)

// Loads annotator by name. A registered annotator component with the name is
// used if there is one. Otherwise the name is resolved as a resource and
// loaded by the first annotator loader that accepts it. The caller takes
// ownership of the returned annotator.
Status LoadAnnotator(const string &name, Annotator **annotator);

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_LABELS_ANNOTATOR_H_
