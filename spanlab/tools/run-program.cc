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


// Runs a labeling program on a text corpus.
//
// Usage: run-program [OPTIONS] PROGRAM [TEXT [OUT]]
//
// The program listing is printed. If TEXT is a file or a directory of files,
// the program is evaluated on it and the type instances are either written to
// OUT as addToType operations or printed.

#include <iostream>
#include <string>
#include <vector>

#include "spanlab/base/flags.h"
#include "spanlab/base/init.h"
#include "spanlab/base/logging.h"
#include "spanlab/base/types.h"
#include "spanlab/nlp/document/corpus.h"
#include "spanlab/nlp/labels/labels-io.h"
#include "spanlab/nlp/labels/labels.h"
#include "spanlab/nlp/program/program.h"

DEFINE_string(labels, "", "Labels to load before evaluation (addToType ops)");

using namespace spanlab;
using namespace spanlab::nlp;

int main(int argc, char *argv[]) {
  Flag::SetUsageMessage("run-program [OPTIONS] PROGRAM [TEXT [OUT]]");
  InitProgram(&argc, &argv);
  if (argc < 2 || argc > 4) {
    std::cerr << argv[0] << " [OPTIONS] PROGRAM [TEXT [OUT]]\n";
    return 1;
  }

  // Parse program.
  Program program;
  Status st = program.ParseFile(argv[1]);
  if (!st.ok()) {
    LOG(ERROR) << "Error parsing " << argv[1] << ": " << st;
    return 1;
  }
  std::cout << "program:\n" << program.ToString();
  if (argc < 3) return 0;

  // Load corpus.
  Corpus corpus;
  st = corpus.Load(argv[2]);
  if (!st.ok()) {
    LOG(ERROR) << "Error loading " << argv[2] << ": " << st;
    return 1;
  }
  LOG(INFO) << "Loaded " << corpus.size() << " documents from " << argv[2];

  Labels labels(&corpus);
  if (!FLAGS_labels.empty()) {
    st = LoadTypesFromOps(FLAGS_labels, labels.original());
    if (!st.ok()) {
      LOG(ERROR) << "Error loading labels from " << FLAGS_labels << ": " << st;
      return 1;
    }
  }

  // Evaluate program.
  st = program.Evaluate(&labels);
  if (!st.ok()) {
    LOG(ERROR) << "Error evaluating " << argv[1] << ": " << st;
    return 1;
  }

  // Output type instances.
  Layer *layer = labels.original();
  if (argc > 3) {
    st = SaveTypesAsOps(*layer, argv[3]);
    if (!st.ok()) {
      LOG(ERROR) << "Error writing " << argv[3] << ": " << st;
      return 1;
    }
  } else {
    std::vector<string> types;
    layer->Types(&types);
    for (const string &type : types) {
      std::cout << "Type " << type << ":\n";
      for (const Span &span : *layer->InstancesOf(type)) {
        std::cout << "\t'" << span.GetText() << "'\n";
      }
    }
  }

  return 0;
}
