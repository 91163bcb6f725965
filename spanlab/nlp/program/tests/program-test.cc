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
#include "spanlab/nlp/document/corpus.h"
#include "spanlab/nlp/document/document.h"
#include "spanlab/nlp/labels/annotator.h"
#include "spanlab/nlp/labels/errors.h"
#include "spanlab/nlp/labels/labels.h"
#include "spanlab/nlp/program/program.h"

DECLARE_string(resource_path);

using namespace spanlab;
using namespace spanlab::nlp;

namespace {

// Labels every capitalized token as 'cap'.
class CapitalsAnnotator : public Annotator {
 public:
  Status Annotate(Layer *layer) override {
    for (const Document *document : layer->corpus()->documents()) {
      for (const Token &token : document->tokens()) {
        char first = token.word()[0];
        if (first >= 'A' && first <= 'Z') {
          layer->AddToType(Span(document, token.index(), token.index() + 1),
                           "cap");
        }
      }
    }
    return Status::OK;
  }
};

}  // namespace

REGISTER_ANNOTATOR("test-capitals", CapitalsAnnotator);

// Test fixture with a small corpus and a label store for it.
class ProgramTest {
 public:
  ProgramTest() {
    corpus_.AddDocument("d1", "Mr. John Smith lives in New York, USA.");
    corpus_.AddDocument("d2", "Paris is big.");
    labels_ = new Labels(&corpus_);
  }

  ~ProgramTest() { delete labels_; }

  // Starts over with empty labels.
  void Reset() {
    delete labels_;
    labels_ = new Labels(&corpus_);
  }

  Layer *layer() { return labels_->original(); }
  const Document *d1() { return corpus_.document(0); }
  const Document *d2() { return corpus_.document(1); }

  // Parses and evaluates program.
  Status Run(const string &source) {
    Program program;
    Status st = program.Parse(source);
    if (!st.ok()) return st;
    return program.Evaluate(labels_);
  }

  // Returns the texts of the instances of a type.
  std::vector<string> Texts(const string &type) {
    std::vector<string> texts;
    const SpanSet *instances = layer()->InstancesOf(type);
    if (instances == nullptr) return texts;
    for (const Span &span : *instances) texts.push_back(span.GetText().str());
    return texts;
  }

  void TestMatch() {
    Reset();
    CHECK(Run("defSpanType name = : ... [ 'John' any ] ...;\n"
              "defSpanType nothing = : ... [ 'Nobody' ] ...;\n"
              "declareSpanType empty;\n"));
    std::vector<string> expected = {"John Smith"};
    CHECK(Texts("name") == expected);
    CHECK(layer()->HasType(Span(d1(), 2, 4), "name"));

    // Types are declared even when nothing matches.
    CHECK(layer()->IsType("nothing"));
    CHECK_EQ(layer()->NumInstances("nothing"), 0);
    CHECK(layer()->IsType("empty"));
    CHECK(!layer()->IsType("other"));

    // Later statements see the labels of earlier ones.
    CHECK(Run("defSpanType after = : ... @name [ any ] ...;"));
    expected = {"lives"};
    CHECK(Texts("after") == expected);

    // Extractions are made from each document.
    CHECK(Run("defSpanType first = : [ any ] ...;"));
    expected = {"Mr", "Paris"};
    CHECK(Texts("first") == expected);
  }

  void TestScope() {
    Reset();
    CHECK(Run("defSpanType cap = ~ re '[A-Z][a-z]+', 0;\n"
              "defSpanType other = cap - 'John';\n"
              "defSpanType j = cap : [ 'John' ];\n"));
    std::vector<string> expected = {"Mr", "John", "Smith", "New", "York",
                                    "Paris"};
    CHECK(Texts("cap") == expected);
    expected = {"Mr", "Smith", "New", "York", "Paris"};
    CHECK(Texts("other") == expected);
    expected = {"John"};
    CHECK(Texts("j") == expected);

    // Undeclared scope types are errors.
    Status st = Run("defSpanType x = nosuch : any;");
    CHECK_EQ(st.code(), REFERENCE_ERROR);
    CHECK(!layer()->IsType("x"));

    // A declared scope with no instances yields nothing.
    CHECK(Run("declareSpanType none; defSpanType y = none : any*;"));
    CHECK(layer()->IsType("y"));
    CHECK_EQ(layer()->NumInstances("y"), 0);
  }

  void TestVisibility() {
    Reset();
    CHECK(Run("defSpanType pre = : [ 'Paris' any? ] ...;"));
    std::vector<string> expected = {"Paris", "Paris is"};
    CHECK(Texts("pre") == expected);

    // Spans from a match are visible when matching later input spans.
    CHECK(Run("defSpanType s = pre : [ 'Paris' ] || [ @s any ];"));
    CHECK(Texts("s") == expected);

    // A filter tests all input spans before labeling any of them.
    CHECK(Run("defSpanType f = pre - @f any?;"));
    CHECK(Texts("f") == expected);
  }

  void TestRegex() {
    Reset();

    // Matches must contain whole tokens.
    CHECK(Run("defSpanType r1 = ~ re 'ohn S', 0;"));
    CHECK(layer()->IsType("r1"));
    CHECK_EQ(layer()->NumInstances("r1"), 0);
    CHECK(Run("defSpanType r2 = ~ re 'ohn Smith', 0;"));
    std::vector<string> expected = {"Smith"};
    CHECK(Texts("r2") == expected);

    // Capture groups select part of the match.
    CHECK(Run("defSpanType york = ~ re '(New) (York)', 2;"));
    expected = {"York"};
    CHECK(Texts("york") == expected);

    // Groups that do not participate are skipped.
    CHECK(Run("defSpanType g = ~ re 'x(y)|Paris', 1;"));
    CHECK_EQ(layer()->NumInstances("g"), 0);

    // Regular expressions are applied to the text of each scope span.
    CHECK(Run("defSpanType name = : ... [ 'John' 'Smith' ] ...;\n"
              "defSpanType initial = name ~ re '^\\w+', 0;"));
    expected = {"John"};
    CHECK(Texts("initial") == expected);
  }

  void TestTrie() {
    Reset();
    CHECK(Run("defSpanType place = ~ trie new york, paris, 'u.s.a'"));
    std::vector<string> expected = {"New York", "Paris"};
    CHECK(Texts("place") == expected);
  }

  void TestProperties() {
    Reset();
    CHECK(Run("defTokenProp pos:cap = : ... [ re('[A-Z].*') ] ...;\n"
              "defSpanType caps = : ... [ L pos:cap+ R ] ...;\n"
              "defSpanProp kind:place = caps : ... 'York';\n"));
    std::vector<string> expected = {"Mr", "John Smith", "New York", "USA",
                                    "Paris"};
    CHECK(Texts("caps") == expected);

    const string *pos = layer()->GetTokenProperty(d1()->token(2), "pos");
    CHECK(pos != nullptr);
    CHECK_EQ(*pos, "cap");
    CHECK(layer()->GetTokenProperty(d1()->token(4), "pos") == nullptr);

    const string *kind = layer()->GetProperty(Span(d1(), 6, 8), "kind");
    CHECK(kind != nullptr);
    CHECK_EQ(*kind, "place");
    CHECK(layer()->GetProperty(Span(d1(), 2, 4), "kind") == nullptr);

    // Token properties are set on every token of the span.
    CHECK(Run("defTokenProp in:city = caps : 'New' 'York';"));
    CHECK(layer()->GetTokenProperty(d1()->token(6), "in") != nullptr);
    CHECK(layer()->GetTokenProperty(d1()->token(7), "in") != nullptr);
    CHECK(layer()->GetTokenProperty(d1()->token(8), "in") == nullptr);
  }

  void TestDictionaries() {
    Reset();
    CHECK(Run("defDict first = JOHN, paris;\n"
              "defDict +case lower = john, paris;\n"
              "defSpanType f = : ... [ a(first) ] ...;\n"
              "defSpanType l = : ... [ a(lower) ] ...;\n"
              "defSpanType li = : ... [ ai(lower) ] ...;\n"));
    std::vector<string> expected = {"John", "Paris"};
    CHECK(Texts("f") == expected);
    CHECK(Texts("li") == expected);
    CHECK(layer()->IsType("l"));
    CHECK_EQ(layer()->NumInstances("l"), 0);

    Status st = Run("defSpanType u = : ... [ a(undefined) ] ...;");
    CHECK_EQ(st.code(), REFERENCE_ERROR);
  }

  void TestLevels() {
    Reset();
    CHECK(Run("defLevel words = re '[A-Za-z]+';\n"
              "onLevel words;\n"
              "defSpanType w = : ... [ 'York' ] ...;\n"
              "offLevel words;\n"
              "importFromLevel words york = w;\n"
              "defSpanType back = : ... [ 'USA' ] ...;\n"));
    Layer *words = labels_->GetLayer("words");
    CHECK(words != nullptr);
    CHECK_EQ(words->corpus()->document(0)->num_tokens(), 8);
    CHECK_EQ(words->NumInstances("w"), 1);
    CHECK(!layer()->IsType("w"));

    std::vector<string> expected = {"York"};
    CHECK(Texts("york") == expected);
    CHECK(layer()->HasType(Span(d1(), 7, 8), "york"));

    // Labels after offLevel go to the original level.
    CHECK_EQ(layer()->NumInstances("back"), 1);
    CHECK(!words->IsType("back"));

    Status st = Run("onLevel nosuch;");
    CHECK_EQ(st.code(), REFERENCE_ERROR);
    st = Run("defLevel words = re 'x';");
    CHECK_EQ(st.code(), REFERENCE_ERROR);
    st = Run("importFromLevel words a = nosuch;");
    CHECK_EQ(st.code(), REFERENCE_ERROR);
  }

  void TestRequire() {
    Reset();
    CHECK(Run("require cap, 'test-capitals';"));
    CHECK_EQ(layer()->NumInstances("cap"), 7);

    // Provided types are not annotated again.
    CHECK(Run("provide given; require given, 'no-such-annotator';"));
    CHECK(!layer()->IsType("given"));

    // Types with instances count as annotated.
    CHECK(Run("require cap, 'no-such-annotator';"));

    Status st = Run("require unknown;");
    CHECK_EQ(st.code(), RESOURCE_ERROR);
    st = Run("annotateWith 'missing.mixup';");
    CHECK_EQ(st.code(), RESOURCE_ERROR);
  }

  void TestProgramFiles() {
    string dir;
    CHECK(File::CreateTempDir(&dir));
    CHECK(File::WriteContents(dir + "/people.mixup",
        "// Finds people.\n"
        "defSpanType person = : ... [ 'John' 'Smith' ] ...;\n"));
    CHECK(File::WriteContents(dir + "/broken.mixup", "defSpanType x ="));
    FLAGS_resource_path = dir;

    Reset();
    CHECK(Run("require person, 'people.mixup';"));
    std::vector<string> expected = {"John Smith"};
    CHECK(Texts("person") == expected);

    Reset();
    CHECK(Run("annotateWith 'people.mixup';"));
    CHECK(Texts("person") == expected);

    // Programs are run on the current level.
    Reset();
    CHECK(Run("defLevel words = re '[A-Za-z]+';\n"
              "onLevel words;\n"
              "annotateWith 'people.mixup';\n"));
    CHECK(!layer()->IsType("person"));
    CHECK_EQ(labels_->GetLayer("words")->NumInstances("person"), 1);

    Status st = Run("annotateWith 'broken.mixup';");
    CHECK_EQ(st.code(), RESOURCE_ERROR);

    Program program;
    CHECK(program.ParseFile("people.mixup"));
    CHECK_EQ(program.size(), 1);
    st = program.ParseFile("missing.mixup");
    CHECK(!st.ok());

    CHECK(File::Delete(dir + "/people.mixup"));
    CHECK(File::Delete(dir + "/broken.mixup"));
    FLAGS_resource_path = "";
  }

  void TestErrorsStopEvaluation() {
    Reset();
    Status st = Run("defSpanType a = : any*;\n"
                    "defSpanType b = nosuch : any;\n"
                    "defSpanType c = : any*;\n");
    CHECK_EQ(st.code(), REFERENCE_ERROR);
    CHECK(layer()->IsType("a"));
    CHECK(!layer()->IsType("c"));
  }

 private:
  Corpus corpus_;
  Labels *labels_;
};

void TestRegexOnLongDocument() {
  // About 100 KB of text in a single document.
  string text;
  for (int i = 0; i < 20000; ++i) text.append("word ");
  Corpus corpus;
  corpus.AddDocument("long", text);
  Labels labels(&corpus);

  Program program;
  CHECK(program.Parse("defSpanType all = ~ re '[a-z ]+', 0;\n"
                      "defSpanType words = ~ re '(word\\s)*', 0;\n"));
  CHECK(program.Evaluate(&labels));

  // The document text ends with the last token, so the final word has no
  // trailing whitespace for the repeated group.
  const Layer *layer = labels.original();
  CHECK_EQ(layer->NumInstances("all"), 1);
  const Span &all = *layer->InstancesOf("all")->begin();
  CHECK_EQ(all.begin(), 0);
  CHECK_EQ(all.length(), 20000);
  CHECK_EQ(layer->NumInstances("words"), 1);
  const Span &words = *layer->InstancesOf("words")->begin();
  CHECK_EQ(words.begin(), 0);
  CHECK_EQ(words.length(), 19999);
}

void TestParsing() {
  CHECK_EQ(Program::StripComments("a // b\nc;\n// d\n"), "a \nc;\n\n");

  Program program;
  CHECK(program.Parse("// comment\n"
                      "declareSpanType a;; declareSpanType b // second\n"
                      ";provide c"));
  CHECK_EQ(program.size(), 3);
  CHECK_EQ(program.statement(0)->ToString(), "declareSpanType a");
  CHECK_EQ(program.statement(2)->kind(), Statement::PROVIDE);

  // A parse error leaves the program unchanged.
  Program partial;
  Status st = partial.Parse("declareSpanType a; bogus; declareSpanType b;");
  CHECK_EQ(st.code(), PARSE_ERROR);
  CHECK_EQ(partial.size(), 0);
  CHECK(partial.Parse("declareSpanType a;"));
  st = partial.Parse("defSpanType a = : any; defSpanType b = ~ re 'x', q;");
  CHECK_EQ(st.code(), PARSE_ERROR);
  CHECK_EQ(partial.size(), 1);
  CHECK_EQ(partial.ToString(), "declareSpanType a;\n");

  Program statements;
  CHECK(statements.ParseStatements({"declareSpanType a", "provide b"}));
  CHECK_EQ(statements.size(), 2);
  CHECK(statements.AddStatement("defDict d = x, y;"));
  CHECK(statements.AddStatement("require b"));
  CHECK_EQ(statements.size(), 4);
  st = statements.AddStatement("declareSpanType c; provide d");
  CHECK_EQ(st.code(), PARSE_ERROR);
  st = statements.AddStatement("");
  CHECK_EQ(st.code(), PARSE_ERROR);
  CHECK_EQ(statements.size(), 4);

  CHECK_EQ(statements.ToString(),
           "declareSpanType a;\n"
           "provide b;\n"
           "defDict d = x, y;\n"
           "require b;\n");
}

void TestRoundTrip() {
  const char *source =
      "defDict +case first = John, \"names.txt\";\n"
      "defSpanType name = : ... [ a ( first ) any ] ... || "
      "... [ 'Paris' ] ...;\n"
      "defSpanType big = name - ... eqi ( 'york' ) ...;\n"
      "defSpanProp kind:place = name ~ trie new york, paris;\n"
      "defTokenProp pos:cap = ~ re '([A-Z])\\w*', 1;\n"
      "defLevel words = split '\\s+';\n"
      "onLevel words;\n"
      "offLevel;\n"
      "importFromLevel words person = name;\n"
      "require person, people.mixup;\n"
      "annotateWith people.mixup;\n";

  string dir;
  CHECK(File::CreateTempDir(&dir));
  CHECK(File::WriteContents(dir + "/names.txt", "Mary\n"));
  FLAGS_resource_path = dir;

  Program program;
  CHECK(program.Parse(source));
  CHECK_EQ(program.size(), 11);
  CHECK_EQ(program.ToString(), source);

  Program reparsed;
  CHECK(reparsed.Parse(program.ToString()));
  CHECK_EQ(reparsed.ToString(), program.ToString());

  CHECK(File::Delete(dir + "/names.txt"));
  FLAGS_resource_path = "";
}

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  ProgramTest test;
  test.TestMatch();
  test.TestScope();
  test.TestVisibility();
  test.TestRegex();
  test.TestTrie();
  test.TestProperties();
  test.TestDictionaries();
  test.TestLevels();
  test.TestRequire();
  test.TestProgramFiles();
  test.TestErrorsStopEvaluation();

  TestRegexOnLongDocument();
  TestParsing();
  TestRoundTrip();

  LOG(INFO) << "PASS";
  return 0;
}
