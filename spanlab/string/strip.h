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


#ifndef SPANLAB_STRING_STRIP_H_
#define SPANLAB_STRING_STRIP_H_

#include <string>
#include <vector>

#include "spanlab/base/types.h"
#include "spanlab/string/text.h"

namespace spanlab {

// Remove leading and trailing whitespace from text.
Text StripWhiteSpace(Text text);

// Remove leading and trailing whitespace from string in place.
void StripWhiteSpace(string *str);

// Split text into lines. A trailing line break does not produce an empty
// last line. Carriage returns before line breaks are removed.
void SplitLines(Text text, std::vector<string> *lines);

}  // namespace spanlab

#endif  // SPANLAB_STRING_STRIP_H_
