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


#ifndef SPANLAB_NLP_PROGRAM_PROGRAM_H_
#define SPANLAB_NLP_PROGRAM_PROGRAM_H_

#include <string>
#include <vector>

#include "spanlab/base/macros.h"
#include "spanlab/base/status.h"
#include "spanlab/base/types.h"
#include "spanlab/nlp/labels/labels.h"
#include "spanlab/nlp/program/statement.h"
#include "spanlab/string/text.h"

namespace spanlab {
namespace nlp {

// A labeling program is a sequence of statements that are evaluated in order
// against a label store. Statements are terminated by semicolons and // starts
// a comment that runs to the end of the line. Comments are stripped before
// the statements are parsed, also inside quoted strings.
class Program {
 public:
  Program() = default;
  ~Program();

  // Parses statements from source text and adds them to the program. If a
  // statement fails to parse, nothing is added and the program is unchanged.
  Status Parse(Text source);

  // Parses program from a resource file.
  Status ParseFile(const string &name);

  // Parses an array of statements. Each statement is terminated with a
  // semicolon.
  Status ParseStatements(const std::vector<string> &statements);

  // Parses a single statement and adds it to the program.
  Status AddStatement(const string &text);

  // Evaluates program against the original level of the label store.
  Status Evaluate(Labels *labels) const;

  // Evaluates program starting at a level of the label store.
  Status Evaluate(Labels *labels, Layer *layer) const;

  // Returns the number of statements in the program.
  int size() const { return statements_.size(); }

  // Returns statement.
  const Statement *statement(int index) const { return statements_[index]; }

  // Returns program in source form. Each statement is followed by a
  // semicolon and a newline.
  string ToString() const;

  // Removes comments from program source.
  static string StripComments(Text source);

 private:
  // Program statements.
  std::vector<Statement *> statements_;

  DISALLOW_COPY_AND_ASSIGN(Program);
};

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_PROGRAM_PROGRAM_H_
