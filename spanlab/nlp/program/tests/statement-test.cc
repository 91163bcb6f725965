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
#include <vector>

#include "spanlab/base/flags.h"
#include "spanlab/base/init.h"
#include "spanlab/base/logging.h"
#include "spanlab/file/file.h"
#include "spanlab/nlp/labels/errors.h"
#include "spanlab/nlp/program/generator.h"
#include "spanlab/nlp/program/program-tokenizer.h"
#include "spanlab/nlp/program/statement.h"

DECLARE_string(resource_path);

using namespace spanlab;
using namespace spanlab::nlp;

// Parses a single statement. The caller takes ownership of the statement.
Status ParseStatement(const string &text, Statement **statement) {
  ProgramTokenizer input(text);
  Status st = Statement::Parse(&input, statement);
  if (st.ok()) CHECK(input.done()) << text;
  return st;
}

// Parses statement and checks that it prints as the expected source form.
Statement *CheckStatement(const string &text, Statement::Kind kind,
                          const string &expected) {
  Statement *statement;
  Status st = ParseStatement(text, &statement);
  CHECK(st) << text;
  CHECK_EQ(statement->kind(), kind) << text;
  CHECK_EQ(statement->ToString(), expected);

  // Reparse the source form.
  Statement *reparsed;
  CHECK(ParseStatement(statement->ToString(), &reparsed)) << expected;
  CHECK_EQ(reparsed->ToString(), expected);
  delete reparsed;
  return statement;
}

// Checks that statement fails to parse with the cause in the error message.
void CheckError(const string &text, const string &keyword,
                const string &cause) {
  Statement *statement = nullptr;
  Status st = ParseStatement(text, &statement);
  CHECK_EQ(st.code(), PARSE_ERROR) << text;
  CHECK(statement == nullptr) << text;
  string message = st.message();
  CHECK(message.find("statement error at ") == 0) << message;
  CHECK(message.find("in '" + keyword + "'") != string::npos) << message;
  CHECK(message.find(cause) != string::npos) << message;
}

void TestSimpleStatements() {
  Statement *s;
  s = CheckStatement("declareSpanType name", Statement::DECLARE,
                     "declareSpanType name");
  CHECK_EQ(static_cast<DeclareStatement *>(s)->type(), "name");
  delete s;

  s = CheckStatement("provide 'my type'", Statement::PROVIDE,
                     "provide 'my type'");
  CHECK_EQ(static_cast<ProvideStatement *>(s)->type(), "my type");
  delete s;

  s = CheckStatement("require person", Statement::REQUIRE, "require person");
  CHECK_EQ(static_cast<RequireStatement *>(s)->file(), "");
  delete s;

  s = CheckStatement("require person, \"people.mixup\"", Statement::REQUIRE,
                     "require person, people.mixup");
  CHECK_EQ(static_cast<RequireStatement *>(s)->type(), "person");
  CHECK_EQ(static_cast<RequireStatement *>(s)->file(), "people.mixup");
  delete s;

  s = CheckStatement("annotateWith 'my file.mixup'", Statement::ANNOTATE_WITH,
                     "annotateWith 'my file.mixup'");
  CHECK_EQ(static_cast<AnnotateWithStatement *>(s)->file(), "my file.mixup");
  delete s;

  s = CheckStatement("onLevel words", Statement::ON_LEVEL, "onLevel words");
  delete s;
  s = CheckStatement("offLevel", Statement::OFF_LEVEL, "offLevel");
  delete s;
  s = CheckStatement("offLevel words", Statement::OFF_LEVEL, "offLevel");
  delete s;

  s = CheckStatement("importFromLevel pseudo person = subject",
                     Statement::IMPORT_FROM_LEVEL,
                     "importFromLevel pseudo person = subject");
  auto *import = static_cast<ImportFromLevelStatement *>(s);
  CHECK_EQ(import->level(), "pseudo");
  CHECK_EQ(import->new_type(), "person");
  CHECK_EQ(import->old_type(), "subject");
  delete s;
}

void TestDictionaries() {
  Statement *s = CheckStatement("defDict first = John, mary, 'Anne Marie'",
                                Statement::DEF_DICT,
                                "defDict first = john, mary, 'anne marie'");
  auto *dict = static_cast<DefDictStatement *>(s);
  CHECK(dict->ignore_case());
  CHECK_EQ(dict->words().size(), 3);
  CHECK_EQ(dict->words().count("john"), 1);
  delete s;

  s = CheckStatement("defDict +case names = John, mary", Statement::DEF_DICT,
                     "defDict +case names = John, mary");
  dict = static_cast<DefDictStatement *>(s);
  CHECK(!dict->ignore_case());
  CHECK_EQ(dict->name(), "names");
  CHECK_EQ(dict->words().count("John"), 1);
  CHECK_EQ(dict->words().count("john"), 0);
  delete s;

  CheckError("defDict + names = a", "defDict", "'case' expected after '+'");
  CheckError("defDict +case = a", "defDict", "dictionary name expected");
  CheckError("defDict d a", "defDict", "'=' expected");
  CheckError("defDict d = a b", "defDict", "expected comma");
  CheckError("defDict d =", "defDict", "dictionary word expected");
  CheckError("defDict d = a,", "defDict", "dictionary word expected");
}

void TestLevels() {
  Statement *s = CheckStatement("defLevel words = re '[A-Za-z]+'",
                                Statement::DEF_LEVEL,
                                "defLevel words = re '[A-Za-z]+'");
  auto *level = static_cast<DefLevelStatement *>(s);
  CHECK_EQ(level->name(), "words");
  CHECK_EQ(level->strategy(), "re");
  CHECK_EQ(level->pattern(), "[A-Za-z]+");
  delete s;

  s = CheckStatement("defLevel pseudo = pseudotoken name",
                     Statement::DEF_LEVEL,
                     "defLevel pseudo = pseudotoken 'name'");
  delete s;

  CheckError("defLevel l = bogus 'x'", "defLevel", "level strategy expected");
  CheckError("defLevel l = re '('", "defLevel", "statement error");
  CheckError("defLevel l re 'x'", "defLevel", "'=' expected");
}

void TestLabeling() {
  Statement *s = CheckStatement("defSpanType name = : ... [ 'John' any ] ...",
                                Statement::LABELING,
                                "defSpanType name = : ... [ 'John' any ] ...");
  auto *labeling = static_cast<LabelingStatement *>(s);
  CHECK_EQ(labeling->effect(), LabelingStatement::SPAN_TYPE);
  CHECK_EQ(labeling->name(), "name");
  CHECK_EQ(labeling->scope(), "");
  CHECK_EQ(labeling->generator()->kind(), Generator::MATCH);
  delete s;

  s = CheckStatement("defSpanType big = name - ... 'Smith' ...",
                     Statement::LABELING,
                     "defSpanType big = name - ... 'Smith' ...");
  labeling = static_cast<LabelingStatement *>(s);
  CHECK_EQ(labeling->scope(), "name");
  CHECK_EQ(labeling->generator()->kind(), Generator::FILTER);
  delete s;

  s = CheckStatement("defSpanProp kind:city = name: ... 'York'",
                     Statement::LABELING,
                     "defSpanProp kind:city = name : ... 'York'");
  labeling = static_cast<LabelingStatement *>(s);
  CHECK_EQ(labeling->effect(), LabelingStatement::SPAN_PROPERTY);
  CHECK_EQ(labeling->name(), "kind");
  CHECK_EQ(labeling->value(), "city");
  delete s;

  s = CheckStatement("defTokenProp pos:'proper noun' = ~ re '([A-Z]\\w+) "
                     "lives', 1",
                     Statement::LABELING,
                     "defTokenProp pos:'proper noun' = ~ re '([A-Z]\\w+) "
                     "lives', 1");
  labeling = static_cast<LabelingStatement *>(s);
  CHECK_EQ(labeling->effect(), LabelingStatement::TOKEN_PROPERTY);
  CHECK_EQ(labeling->value(), "proper noun");
  auto *regex = static_cast<const RegexGenerator *>(labeling->generator());
  CHECK_EQ(regex->kind(), Generator::REGEX);
  CHECK_EQ(regex->group(), 1);
  delete s;

  s = CheckStatement("defSpanType city = ~ trie new york, 'los angeles', paris",
                     Statement::LABELING,
                     "defSpanType city = ~ trie new york, 'los angeles', "
                     "paris");
  labeling = static_cast<LabelingStatement *>(s);
  auto *trie = static_cast<const TrieGenerator *>(labeling->generator());
  CHECK_EQ(trie->kind(), Generator::TRIE);
  CHECK_EQ(trie->trie().size(), 3);
  std::vector<string> keys;
  trie->trie().Find({"Los", "Angeles"}, &keys);
  CHECK_EQ(keys.size(), 1);
  CHECK_EQ(keys[0], "phrase#1");
  delete s;

  // The final phrase of a trie ends with the statement.
  s = CheckStatement("defSpanType x = ~ trie a b, c", Statement::LABELING,
                     "defSpanType x = ~ trie a b, c");
  trie = static_cast<const TrieGenerator *>(
      static_cast<LabelingStatement *>(s)->generator());
  CHECK_EQ(trie->trie().size(), 2);
  trie->trie().Find({"c"}, &keys);
  CHECK_EQ(keys.size(), 1);
  delete s;
}

void TestLabelingErrors() {
  CheckError("defSpanType name:x = : any", "defSpanType",
             "can't define properties here");
  CheckError("defSpanProp kind = : any", "defSpanProp",
             "':' expected after property");
  CheckError("defTokenProp kind: = : any", "defTokenProp",
             "property value expected");
  CheckError("defSpanType t = ~ re 'a', x", "defSpanType",
             "expected a regex group number and saw 'x'");
  CheckError("defSpanType t = ~ re '(a)', 2", "defSpanType",
             "no capture group 2");
  CheckError("defSpanType t = ~ re '(', 0", "defSpanType", "statement error");
  CheckError("defSpanType t = ~ foo", "defSpanType", "expected 're' or 'trie'");
  CheckError("defSpanType t = name any", "defSpanType",
             "expected ':', '-' or '~'");
  CheckError("defSpanType t : any", "defSpanType",
             "can't define properties here");
  CheckError("defSpanType t = : [ any", "defSpanType", "missing ']'");
  CheckError("defSpanType t = :", "defSpanType", "empty pattern");
}

void TestGeneralErrors() {
  CheckError("frobnicate x", "frobnicate", "unknown keyword");
  CheckError("declareSpanType", "declareSpanType", "type name expected");
  CheckError("declareSpanType a b", "declareSpanType", "';' expected");
  CheckError("onLevel", "onLevel", "level name expected");
  CheckError("require a b", "require", "';' expected");
  CheckError("importFromLevel l a b", "importFromLevel", "'=' expected");

  // The error position is the offending token.
  Statement *statement;
  Status st = ParseStatement("declareSpanType a b", &statement);
  CHECK_EQ(string(st.message()),
           "statement error at 1:19 in 'declareSpanType': ';' expected");
}

void TestFileReferences() {
  string dir;
  CHECK(File::CreateTempDir(&dir));
  CHECK(File::WriteContents(dir + "/names.txt", "John\n\n  Mary \n"));
  CHECK(File::WriteContents(dir + "/places.txt", "New York\nUSA\n"));
  FLAGS_resource_path = dir;

  Statement *s = CheckStatement("defDict +case names = \"names.txt\", Smith",
                                Statement::DEF_DICT,
                                "defDict +case names = \"names.txt\", Smith");
  auto *dict = static_cast<DefDictStatement *>(s);
  CHECK_EQ(dict->words().size(), 3);
  CHECK_EQ(dict->words().count("Mary"), 1);
  delete s;

  s = CheckStatement("defSpanType place = ~ trie \"places.txt\", paris",
                     Statement::LABELING,
                     "defSpanType place = ~ trie \"places.txt\", paris");
  auto *trie = static_cast<const TrieGenerator *>(
      static_cast<LabelingStatement *>(s)->generator());
  CHECK_EQ(trie->trie().size(), 3);
  std::vector<string> keys;
  trie->trie().Find({"usa"}, &keys);
  CHECK_EQ(keys.size(), 1);
  CHECK_EQ(keys[0], "places.txt.line.2");
  delete s;

  CheckError("defDict d = \"missing.txt\"", "defDict",
             "error when reading missing.txt");
  CheckError("defSpanType t = ~ trie \"missing.txt\"", "defSpanType",
             "error when reading missing.txt");
  CheckError("defDict d = \"names.txt", "defDict", "unterminated file name");

  CHECK(File::Delete(dir + "/names.txt"));
  CHECK(File::Delete(dir + "/places.txt"));
  FLAGS_resource_path = "";
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  TestSimpleStatements();
  TestDictionaries();
  TestLevels();
  TestLabeling();
  TestLabelingErrors();
  TestGeneralErrors();
  TestFileReferences();

  LOG(INFO) << "PASS";
  return 0;
}
