// Copyright 2017 Google Inc.
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


#include "spanlab/base/init.h"

#include <stdlib.h>

#include "spanlab/base/flags.h"
#include "spanlab/base/logging.h"

namespace spanlab {

ModuleInitializer *ModuleInitializer::first = nullptr;
ModuleInitializer *ModuleInitializer::last = nullptr;

ModuleInitializer::ModuleInitializer(const char *n, Handler h)
    : name(n), handler(h), next(nullptr) {
  if (last == nullptr) {
    first = this;
  } else {
    last->next = this;
  }
  last = this;
}

void InitProgram(int *argc, char ***argv) {
  if (Flag::ParseCommandLineFlags(argc, *argv) != 0) exit(1);

  for (ModuleInitializer *m = ModuleInitializer::first; m != nullptr;
       m = m->next) {
    VLOG(2) << "Initializing " << m->name << " module";
    m->handler();
  }
}

}  // namespace spanlab
