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


#include <string>

#include "spanlab/base/logging.h"
#include "spanlab/file/file.h"
#include "spanlab/nlp/labels/annotator.h"
#include "spanlab/nlp/labels/labels.h"
#include "spanlab/nlp/program/program.h"

namespace spanlab {
namespace nlp {

// Annotator that runs a labeling program.
class ProgramAnnotator : public Annotator {
 public:
  Status Init(const string &filename) {
    return program_.ParseFile(filename);
  }

  Status Annotate(Layer *layer) override {
    return program_.Evaluate(layer->labels(), layer);
  }

 private:
  Program program_;
};

// Loads annotators from program files.
class ProgramAnnotatorLoader : public AnnotatorLoader {
 public:
  bool Accepts(const string &filename) override {
    return File::Exists(filename);
  }

  Status Load(const string &filename, Annotator **annotator) override {
    ProgramAnnotator *program = new ProgramAnnotator();
    Status st = program->Init(filename);
    if (!st.ok()) {
      delete program;
      return st;
    }
    VLOG(1) << "Loaded annotator program " << filename;
    *annotator = program;
    return Status::OK;
  }
};

REGISTER_ANNOTATOR_LOADER("program", ProgramAnnotatorLoader);

}  // namespace nlp
}  // namespace spanlab
