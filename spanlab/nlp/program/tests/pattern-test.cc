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

#include "spanlab/base/init.h"
#include "spanlab/base/logging.h"
#include "spanlab/nlp/document/corpus.h"
#include "spanlab/nlp/document/document.h"
#include "spanlab/nlp/labels/errors.h"
#include "spanlab/nlp/labels/labels.h"
#include "spanlab/nlp/program/pattern.h"
#include "spanlab/nlp/program/phrase-trie.h"
#include "spanlab/nlp/program/program-tokenizer.h"

using namespace spanlab;
using namespace spanlab::nlp;

// Test fixture with a labeled document.
class PatternTest {
 public:
  PatternTest() : labels_(&corpus_) {
    document_ = corpus_.AddDocument("d", "Mr. John Smith lives in New York, USA.");
    layer()->AddToType(Span(document_, 2, 4), "name");
    layer()->AddToType(Span(document_, 6, 8), "name");
    layer()->SetTokenProperty(document_->token(6), "kind", "city");
    layer()->SetTokenProperty(document_->token(7), "kind", "city");
    labels_.DefineDictionary("first", {"john", "mary"}, true);
    labels_.DefineDictionary("First", {"John"}, false);
  }

  Layer *layer() { return labels_.original(); }

  // Parses pattern and checks that all input is consumed.
  Status Parse(const string &source, Pattern *pattern) {
    ProgramTokenizer input(source);
    Status st = pattern->Parse(&input);
    if (st.ok()) CHECK(input.done()) << source;
    return st;
  }

  // Returns the texts extracted by pattern from the whole document.
  std::vector<string> Extract(const string &source) {
    Pattern pattern;
    CHECK(Parse(source, &pattern)) << source;
    std::vector<Span> spans;
    CHECK(pattern.Extract(*layer(), document_->GetSpan(), &spans)) << source;
    std::vector<string> texts;
    for (const Span &span : spans) texts.push_back(span.GetText().str());
    return texts;
  }

  // Checks that pattern fails to parse.
  void CheckParseError(const string &source) {
    Pattern pattern;
    Status st = Parse(source, &pattern);
    CHECK_EQ(st.code(), PARSE_ERROR) << source;
  }

  void TestLiterals() {
    std::vector<string> expected = {"John Smith"};
    CHECK(Extract("... [ 'John' any ] ...") == expected);
    CHECK(Extract("... [ eq('John') 'Smith' ] ...") == expected);

    expected = {"New York"};
    CHECK(Extract("... [ eqi('new') eqi('YORK') ] ...") == expected);

    // Without brackets the whole span is extracted.
    expected = {"Mr. John Smith lives in New York, USA."};
    CHECK(Extract("'Mr' ...") == expected);

    // The pattern must match the whole span.
    CHECK(Extract("'Mr'").empty());
    CHECK(Extract("... 'John'").empty());
  }

  void TestRepeats() {
    std::vector<string> expected = {"Mr.", "Mr. John"};
    CHECK(Extract("[ any{2,3} ] ...") == expected);

    expected = {"Mr. John"};
    CHECK(Extract("[ any{3} ] ...") == expected);

    expected = {"John"};
    CHECK(Extract("'Mr' '.'? [ 'John' ] ...") == expected);
    CHECK(Extract("'Mr' ','? '.' [ 'John' ] ...") == expected);

    // Runs that are maximal on both sides.
    expected = {"Mr", "John Smith", "New York"};
    CHECK(Extract("... [ L re('[A-Z][a-z]+')+ R ] ...") == expected);

    // Runs that are only maximal to the right.
    expected = {"Mr", "John Smith", "Smith", "New York", "York"};
    CHECK(Extract("... [ re('[A-Z][a-z]+')+ R ] ...") == expected);

    expected = {"Mr. John Smith lives in New York, USA."};
    CHECK(Extract("any* ") == expected);
    CHECK(Extract("any{5,}").size() == 1);
    CHECK(Extract("any{12,}").empty());
  }

  void TestAlternatives() {
    std::vector<string> expected = {"John", "USA"};
    CHECK(Extract("... [ 'USA' ] ... || ... [ 'John' ] ...") == expected);

    // Duplicate extractions are only reported once.
    expected = {"John"};
    CHECK(Extract("... [ 'John' ] ... || ... [ eq('John') ] ...") == expected);
  }

  void TestDictionaries() {
    std::vector<string> expected = {"John"};
    CHECK(Extract("... [ a(first) ] ...") == expected);
    CHECK(Extract("... [ ai(first) ] ...") == expected);
    CHECK(Extract("... [ a(First) ] ...") == expected);

    // The lower-cased token is not in the case-sensitive dictionary.
    CHECK(Extract("... [ ai(First) ] ...").empty());

    // Undefined dictionaries are reported when the pattern is used.
    Pattern pattern;
    CHECK(Parse("... [ a(nodict) ] ...", &pattern));
    std::vector<Span> spans;
    Status st = pattern.Extract(*layer(), document_->GetSpan(), &spans);
    CHECK_EQ(st.code(), REFERENCE_ERROR);
    bool found;
    st = pattern.HasExtraction(*layer(), document_->GetSpan(), &found);
    CHECK_EQ(st.code(), REFERENCE_ERROR);
  }

  void TestProperties() {
    std::vector<string> expected = {"New York"};
    CHECK(Extract("... [ kind:city{2} ] ...") == expected);
    CHECK(Extract("... [ L kind:'city'+ R ] ...") == expected);
    CHECK(Extract("... [ L kind+ R ] ...") == expected);
    CHECK(Extract("... [ kind:town ] ...").empty());

    // L and R without a test are property names.
    CHECK(Extract("... L ...").empty());
    CHECK(Extract("... R:x ...").empty());
  }

  void TestCompound() {
    std::vector<string> expected = {"John", "Smith", "New", "York"};
    CHECK(Extract("... [ <re('[A-Z].*'), !'Mr', !'USA'> ] ...") == expected);

    expected = {"Mr", "John", "Smith", "New", "York"};
    CHECK(Extract("... [ <re('[A-Z].*'), !re('[A-Z]+')> ] ...") == expected);
  }

  void TestInstances() {
    std::vector<string> expected = {","};
    CHECK(Extract("... @name [ ',' ] ...") == expected);

    expected = {"John Smith", "New York"};
    CHECK(Extract("... [ @name ] ...") == expected);

    // Optional instance.
    expected = {"John", "lives"};
    CHECK(Extract("'Mr' '.' @name? [ any ] ...") == expected);

    // Instances must end inside the input span.
    Pattern pattern;
    CHECK(Parse("'Mr' '.' [ @name ]", &pattern));
    std::vector<Span> spans;
    CHECK(pattern.Extract(*layer(), Span(document_, 0, 3), &spans));
    CHECK(spans.empty());
    CHECK(pattern.Extract(*layer(), Span(document_, 0, 4), &spans));
    CHECK_EQ(spans.size(), 1);
    CHECK(spans[0] == Span(document_, 2, 4));
  }

  void TestParseErrors() {
    CheckParseError("");
    CheckParseError("[ any");
    CheckParseError("any ]");
    CheckParseError("[ [ any ] ]");
    CheckParseError("[ any ] [ any ]");
    CheckParseError("eq(John)");
    CheckParseError("re('(')");
    CheckParseError("foo('x')");
    CheckParseError("any{3,2}");
    CheckParseError("any{x}");
    CheckParseError("<any any>");
    CheckParseError("@");
    CheckParseError("kind:");
    CheckParseError("any ||");
  }

  void TestToString() {
    Pattern pattern;
    CHECK(Parse("...[a(first)'x']  ||kind:city{2,}R", &pattern));
    CHECK_EQ(pattern.ToString(),
             "... [ a ( first ) 'x' ] || kind : city { 2 , } R");

    // The source form parses to the same pattern.
    Pattern reparsed;
    CHECK(Parse(pattern.ToString(), &reparsed));
    CHECK_EQ(reparsed.ToString(), pattern.ToString());
  }

  void TestTrie() {
    PhraseTrie trie;
    trie.AddPhrase("p1", "New York");
    trie.AddPhrase("p2", "new york city");
    trie.AddPhrase("p3", "YORK");
    trie.AddPhrase("p4", "Smith lives");
    trie.AddPhrase("p5", "  ");
    CHECK_EQ(trie.size(), 4);

    std::vector<string> matches;
    trie.Lookup(document_->GetSpan(), [&matches](const Span &span) {
      matches.push_back(span.GetText().str());
    });
    std::vector<string> expected = {"Smith lives", "New York", "York"};
    CHECK(matches == expected);

    // Matches must lie inside the span.
    matches.clear();
    trie.Lookup(Span(document_, 0, 7), [&matches](const Span &span) {
      matches.push_back(span.GetText().str());
    });
    expected = {"Smith lives"};
    CHECK(matches == expected);

    std::vector<string> keys;
    trie.Find({"NEW", "york"}, &keys);
    CHECK_EQ(keys.size(), 1);
    CHECK_EQ(keys[0], "p1");
    trie.Find({"new"}, &keys);
    CHECK(keys.empty());
    trie.Find({}, &keys);
    CHECK(keys.empty());

    // Phrases are tokenized like documents.
    PhraseTrie punctuated;
    punctuated.AddPhrase("usa", "USA.");
    matches.clear();
    punctuated.Lookup(document_->GetSpan(), [&matches](const Span &span) {
      matches.push_back(span.GetText().str());
    });
    expected = {"USA."};
    CHECK(matches == expected);
  }

 private:
  Corpus corpus_;
  Labels labels_;
  Document *document_;
};

int main(int argc, char *argv[]) {
  InitProgram(&argc, &argv);

  PatternTest test;
  test.TestLiterals();
  test.TestRepeats();
  test.TestAlternatives();
  test.TestDictionaries();
  test.TestProperties();
  test.TestCompound();
  test.TestInstances();
  test.TestParseErrors();
  test.TestToString();
  test.TestTrie();

  LOG(INFO) << "PASS";
  return 0;
}
