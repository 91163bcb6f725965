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


#ifndef SPANLAB_STRING_NUMBERS_H_
#define SPANLAB_STRING_NUMBERS_H_

#include "spanlab/base/types.h"
#include "spanlab/string/text.h"

namespace spanlab {

// Convert text to a 32-bit integer. Leading and trailing whitespace is
// allowed. Returns false if the text is not a number or out of range.
bool safe_strto32(Text text, int32 *value);

}  // namespace spanlab

#endif  // SPANLAB_STRING_NUMBERS_H_
