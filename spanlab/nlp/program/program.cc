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


#include "spanlab/nlp/program/program.h"

#include "spanlab/base/clock.h"
#include "spanlab/base/logging.h"
#include "spanlab/file/resource.h"
#include "spanlab/nlp/labels/errors.h"
#include "spanlab/nlp/program/program-tokenizer.h"
#include "spanlab/string/strip.h"

namespace spanlab {
namespace nlp {

Program::~Program() {
  for (Statement *statement : statements_) delete statement;
}

string Program::StripComments(Text source) {
  std::vector<string> lines;
  SplitLines(source, &lines);
  string result;
  for (const string &line : lines) {
    size_t comment = line.find("//");
    if (comment == string::npos) {
      result.append(line);
    } else {
      result.append(line, 0, comment);
    }
    result.push_back('\n');
  }
  return result;
}

Status Program::Parse(Text source) {
  string stripped = StripComments(source);
  ProgramTokenizer input(stripped);
  std::vector<Statement *> parsed;
  for (;;) {
    // Skip empty statements.
    while (input.token() == ';') input.NextToken();
    if (input.done()) break;

    Statement *statement;
    Status st = Statement::Parse(&input, &statement);
    if (!st.ok()) {
      for (Statement *s : parsed) delete s;
      return st;
    }
    parsed.push_back(statement);
  }
  statements_.insert(statements_.end(), parsed.begin(), parsed.end());
  return Status::OK;
}

Status Program::ParseFile(const string &name) {
  string source;
  Status st = ReadResource(name, &source);
  if (!st.ok()) return st;
  return Parse(source);
}

Status Program::ParseStatements(const std::vector<string> &statements) {
  string source;
  for (const string &statement : statements) {
    source.append(statement);
    source.append(";\n");
  }
  return Parse(source);
}

Status Program::AddStatement(const string &text) {
  string stripped = StripComments(text);
  ProgramTokenizer input(stripped);
  Statement *statement;
  Status st = Statement::Parse(&input, &statement);
  if (!st.ok()) return st;
  if (input.token() == ';') input.NextToken();
  if (!input.done()) {
    delete statement;
    return Status(PARSE_ERROR, "Only one statement expected in '" + text + "'");
  }
  statements_.push_back(statement);
  return Status::OK;
}

Status Program::Evaluate(Labels *labels) const {
  return Evaluate(labels, labels->original());
}

Status Program::Evaluate(Labels *labels, Layer *layer) const {
  Evaluation eval(labels, layer);
  for (const Statement *statement : statements_) {
    VLOG(1) << "Evaluating: " << statement->ToString();
    Clock clock;
    clock.start();
    Status st = statement->Execute(&eval);
    clock.stop();
    if (!st.ok()) {
      LOG(ERROR) << "Error evaluating '" << statement->ToString() << "': "
                 << st;
      return st;
    }
    VLOG(1) << "time: " << clock.secs() << " sec";
  }
  return Status::OK;
}

string Program::ToString() const {
  string str;
  for (const Statement *statement : statements_) {
    str.append(statement->ToString());
    str.append(";\n");
  }
  return str;
}

}  // namespace nlp
}  // namespace spanlab
