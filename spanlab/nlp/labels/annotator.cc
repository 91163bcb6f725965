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


#include "spanlab/nlp/labels/annotator.h"

#include <string>

#include "spanlab/base/logging.h"
#include "spanlab/file/resource.h"
#include "spanlab/nlp/labels/errors.h"

REGISTER_COMPONENT_REGISTRY("annotator", spanlab::nlp::Annotator);
REGISTER_SINGLETON_REGISTRY("annotator loader", spanlab::nlp::AnnotatorLoader);

namespace spanlab {
namespace nlp {

Status LoadAnnotator(const string &name, Annotator **annotator) {
  // Try registered annotators.
  if (Annotator::IsRegistered(name)) {
    VLOG(1) << "Using annotator component " << name;
    *annotator = Annotator::Create(name);
    return Status::OK;
  }

  // Find resource file for annotator.
  string filename;
  Status st = ResolveResource(name, &filename);
  if (!st.ok()) {
    return ResourceError("No annotator found for '" + name + "': " +
                         st.message());
  }

  // Try each loader in turn.
  auto *registry = AnnotatorLoader::registry();
  for (auto *loader = registry->components; loader != nullptr;
       loader = loader->next()) {
    if (!loader->object()->Accepts(filename)) continue;
    VLOG(1) << "Loading annotator " << filename << " with "
            << loader->type() << " loader";
    st = loader->object()->Load(filename, annotator);
    if (!st.ok()) {
      return ResourceError("Cannot load annotator from " + filename + ": " +
                           st.message());
    }
    return Status::OK;
  }

  return ResourceError("No loader for annotator " + filename);
}

}  // namespace nlp
}  // namespace spanlab
