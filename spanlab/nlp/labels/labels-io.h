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


#ifndef SPANLAB_NLP_LABELS_LABELS_IO_H_
#define SPANLAB_NLP_LABELS_LABELS_IO_H_

#include <string>

#include "spanlab/base/status.h"
#include "spanlab/base/types.h"
#include "spanlab/nlp/labels/labels.h"

namespace spanlab {
namespace nlp {

// Type instances are saved as one operation per line:
//   addToType DOCID BEGIN LENGTH TYPE
// where BEGIN and LENGTH give the byte range of the instance in the document
// text.

// Returns the operation for adding a span to a type.
string AddToTypeOp(const Span &span, const string &type);

// Saves all type instances in layer to file.
Status SaveTypesAsOps(const Layer &layer, const string &filename);

// Loads type instances from file into layer. Spans are mapped onto the tokens
// of the layer through their byte ranges.
Status LoadTypesFromOps(const string &filename, Layer *layer);

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_LABELS_LABELS_IO_H_
