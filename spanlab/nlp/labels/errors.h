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


#ifndef SPANLAB_NLP_LABELS_ERRORS_H_
#define SPANLAB_NLP_LABELS_ERRORS_H_

#include <string>

#include "spanlab/base/status.h"
#include "spanlab/base/types.h"

namespace spanlab {
namespace nlp {

// Error codes for labeling programs.
enum LabelingError {
  PARSE_ERROR = 1000,      // malformed program statement
  REFERENCE_ERROR = 1001,  // reference to undefined type, level or dictionary
  RESOURCE_ERROR = 1002,   // annotator or resource cannot be loaded
};

inline Status ReferenceError(const string &msg) {
  return Status(REFERENCE_ERROR, msg);
}

inline Status ResourceError(const string &msg) {
  return Status(RESOURCE_ERROR, msg);
}

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_LABELS_ERRORS_H_
