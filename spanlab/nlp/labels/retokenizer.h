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


#ifndef SPANLAB_NLP_LABELS_RETOKENIZER_H_
#define SPANLAB_NLP_LABELS_RETOKENIZER_H_

#include <string>

#include "spanlab/base/registry.h"
#include "spanlab/base/status.h"
#include "spanlab/base/types.h"
#include "spanlab/nlp/document/document.h"

namespace spanlab {
namespace nlp {

class Layer;

// A retokenizer derives a new tokenization level from a source level. The
// strategies are registered by name:
//   re           every match of a regular expression becomes a token
//   split        the text between matches of a regular expression becomes a
//                token
//   filter       source tokens that match a regular expression are removed
//   pseudotoken  each instance of a type becomes a single token
class Retokenizer : public Component<Retokenizer> {
 public:
  virtual ~Retokenizer() = default;

  // Initializes retokenizer with pattern for the source level.
  virtual Status Init(const string &pattern, const Layer &source) = 0;

  // Adds tokens to target document for source document.
  virtual void Retokenize(const Layer &source, const Document &document,
                          Document *target) = 0;
};

#define REGISTER_RETOKENIZER(type, component) \
  REGISTER_COMPONENT_TYPE(spanlab::nlp::Retokenizer, type, component)

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_LABELS_RETOKENIZER_H_
