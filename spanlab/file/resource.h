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


#ifndef SPANLAB_FILE_RESOURCE_H_
#define SPANLAB_FILE_RESOURCE_H_

#include <string>
#include <vector>

#include "spanlab/base/status.h"
#include "spanlab/base/types.h"

namespace spanlab {

// Resources are files like dictionaries, phrase lists, and programs that are
// referred to by name. A resource name is first tried as a file name and then
// looked up in the directories of the --resource_path flag.

// Resolves resource name to a file name. Returns an error if the resource
// cannot be found.
Status ResolveResource(const string &name, string *filename);

// Reads the contents of a resource.
Status ReadResource(const string &name, string *contents);

// Reads the lines of a resource.
Status ReadResourceLines(const string &name, std::vector<string> *lines);

// Returns the directories in the resource path.
std::vector<string> ResourcePath();

}  // namespace spanlab

#endif  // SPANLAB_FILE_RESOURCE_H_
