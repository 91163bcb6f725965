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


#include "spanlab/nlp/program/statement.h"

#include <vector>

#include "spanlab/base/logging.h"
#include "spanlab/file/resource.h"
#include "spanlab/nlp/labels/annotator.h"
#include "spanlab/nlp/labels/errors.h"
#include "spanlab/nlp/labels/retokenizer.h"
#include "spanlab/nlp/program/pattern.h"
#include "spanlab/string/numbers.h"
#include "spanlab/string/strip.h"
#include "spanlab/util/regexp.h"
#include "spanlab/util/unicode.h"

namespace spanlab {
namespace nlp {

Status Evaluation::OnLevel(const string &name) {
  Layer *layer = labels_->GetLayer(name);
  if (layer == nullptr) return ReferenceError("no level named '" + name + "'");
  layer_ = layer;
  return Status::OK;
}

Status DeclareStatement::Execute(Evaluation *eval) const {
  eval->layer()->DeclareType(type_);
  return Status::OK;
}

string DeclareStatement::ToString() const {
  return "declareSpanType " + ProgramTokenizer::QuoteIfNeeded(type_);
}

Status ProvideStatement::Execute(Evaluation *eval) const {
  eval->labels()->SetAnnotatedBy(type_);
  return Status::OK;
}

string ProvideStatement::ToString() const {
  return "provide " + ProgramTokenizer::QuoteIfNeeded(type_);
}

Status RequireStatement::Execute(Evaluation *eval) const {
  return eval->labels()->Require(type_, file_, eval->layer());
}

string RequireStatement::ToString() const {
  string str = "require " + ProgramTokenizer::QuoteIfNeeded(type_);
  if (!file_.empty()) {
    str.append(", ");
    str.append(ProgramTokenizer::QuoteIfNeeded(file_));
  }
  return str;
}

Status AnnotateWithStatement::Execute(Evaluation *eval) const {
  Annotator *annotator;
  Status st = LoadAnnotator(file_, &annotator);
  if (!st.ok()) return st;
  st = annotator->Annotate(eval->layer());
  delete annotator;
  return st;
}

string AnnotateWithStatement::ToString() const {
  return "annotateWith " + ProgramTokenizer::QuoteIfNeeded(file_);
}

void DefDictStatement::AddWord(const string &word) {
  string entry = ignore_case_ ? UTF8::Lower(word) : word;
  words_.insert(entry);
  entries_.push_back(ProgramTokenizer::QuoteIfNeeded(entry));
}

void DefDictStatement::AddFile(const string &filename,
                               const std::vector<string> &lines) {
  for (string line : lines) {
    StripWhiteSpace(&line);
    if (line.empty()) continue;
    words_.insert(ignore_case_ ? UTF8::Lower(line) : line);
  }
  entries_.push_back("\"" + filename + "\"");
}

Status DefDictStatement::Execute(Evaluation *eval) const {
  eval->labels()->DefineDictionary(name_, words_, ignore_case_);
  return Status::OK;
}

string DefDictStatement::ToString() const {
  string str = "defDict ";
  if (!ignore_case_) str.append("+case ");
  str.append(ProgramTokenizer::QuoteIfNeeded(name_));
  str.append(" =");
  for (int i = 0; i < entries_.size(); ++i) {
    str.append(i == 0 ? " " : ", ");
    str.append(entries_[i]);
  }
  return str;
}

Status DefLevelStatement::Execute(Evaluation *eval) const {
  return eval->labels()->CreateLevel(name_, strategy_, pattern_,
                                     *eval->layer());
}

string DefLevelStatement::ToString() const {
  return "defLevel " + ProgramTokenizer::QuoteIfNeeded(name_) + " = " +
         strategy_ + " " + ProgramTokenizer::Quote(pattern_);
}

Status OnLevelStatement::Execute(Evaluation *eval) const {
  return eval->OnLevel(name_);
}

string OnLevelStatement::ToString() const {
  return "onLevel " + ProgramTokenizer::QuoteIfNeeded(name_);
}

Status OffLevelStatement::Execute(Evaluation *eval) const {
  eval->OffLevel();
  return Status::OK;
}

string OffLevelStatement::ToString() const {
  return "offLevel";
}

Status ImportFromLevelStatement::Execute(Evaluation *eval) const {
  return eval->labels()->ImportFromLevel(level_, old_type_, eval->layer(),
                                         new_type_);
}

string ImportFromLevelStatement::ToString() const {
  return "importFromLevel " + ProgramTokenizer::QuoteIfNeeded(level_) + " " +
         ProgramTokenizer::QuoteIfNeeded(new_type_) + " = " +
         ProgramTokenizer::QuoteIfNeeded(old_type_);
}

Status LabelingStatement::Execute(Evaluation *eval) const {
  Layer *layer = eval->layer();

  // Get input spans for scope.
  std::vector<Span> input;
  if (scope_.empty()) {
    layer->DocumentSpans(&input);
  } else {
    const SpanSet *instances = layer->InstancesOf(scope_);
    if (instances == nullptr) {
      return ReferenceError("no type '" + scope_ + "' defined");
    }
    input.assign(instances->begin(), instances->end());
  }

  // Run generator and label the output spans.
  Status st = generator_->Generate(input, *layer, [this, layer](const Span &s) {
    Extend(layer, s);
  });
  if (!st.ok()) return st;

  // The type is declared even if nothing was labeled.
  if (effect_ == SPAN_TYPE) layer->DeclareType(name_);
  return Status::OK;
}

void LabelingStatement::Extend(Layer *layer, const Span &span) const {
  switch (effect_) {
    case SPAN_TYPE:
      layer->AddToType(span, name_);
      break;
    case SPAN_PROPERTY:
      layer->SetProperty(span, name_, value_);
      break;
    case TOKEN_PROPERTY:
      for (int i = 0; i < span.length(); ++i) {
        layer->SetTokenProperty(span.token(i), name_, value_);
      }
      break;
  }
}

string LabelingStatement::ToString() const {
  string str;
  switch (effect_) {
    case SPAN_TYPE:
      str = "defSpanType " + ProgramTokenizer::QuoteIfNeeded(name_);
      break;
    case SPAN_PROPERTY:
    case TOKEN_PROPERTY:
      str = effect_ == SPAN_PROPERTY ? "defSpanProp " : "defTokenProp ";
      str.append(ProgramTokenizer::QuoteIfNeeded(name_));
      str.append(":");
      str.append(ProgramTokenizer::QuoteIfNeeded(value_));
      break;
  }
  str.append(" = ");
  if (!scope_.empty()) {
    str.append(ProgramTokenizer::QuoteIfNeeded(scope_));
    str.append(" ");
  }
  str.append(generator_->ToString());
  return str;
}

namespace {

// Recursive-descent parser for a single statement.
class StatementParser {
 public:
  explicit StatementParser(ProgramTokenizer *input) : input_(input) {}

  // Parses statement at current input position.
  Status Parse(Statement **statement);

 private:
  // Parsers for statement kinds.
  Status ParseDictionary(Statement **statement);
  Status ParseLevel(Statement **statement);
  Status ParseImport(Statement **statement);
  Status ParseLabeling(LabelingStatement::Effect effect,
                       Statement **statement);
  Status ParseRegex(Generator **generator);
  Status ParseTrie(Generator **generator);

  // Parses name which is either a word, a quoted string, or a sequence of
  // tokens between double quotes.
  Status ParseName(const char *what, string *name);

  // Checks if the current token can be parsed as a name.
  bool AtName() const {
    int t = input_->token();
    return t == ProgramTokenizer::WORD_TOKEN ||
           t == ProgramTokenizer::QUOTED_TOKEN || t == '"';
  }

  // Parses the file name inside double quotes. The opening quote is the
  // current token.
  Status ParseFileName(string *filename);

  // Reads the lines of a resource file referenced in the program.
  Status ReadLines(const string &filename, std::vector<string> *lines);

  // Consumes the expected single-character token.
  Status Expect(int token);

  // Checks that the statement has ended.
  Status ExpectEnd();

  // Checks if the current token terminates the statement.
  bool AtEnd() const {
    return input_->token() == ';' || input_->token() == Scanner::END;
  }

  // Reads next token.
  void Next() { input_->NextToken(); }

  // Returns parse error for the current position.
  Status Error(const string &cause) const;

  // Program input.
  ProgramTokenizer *input_;

  // Statement keyword.
  string keyword_;
};

Status StatementParser::Error(const string &cause) const {
  string message = input_->error() ? input_->error_message() : cause;
  return Status(PARSE_ERROR, "statement error at " +
                std::to_string(input_->token_line()) + ":" +
                std::to_string(input_->token_column()) + " in '" + keyword_ +
                "': " + message);
}

Status StatementParser::Expect(int token) {
  if (input_->token() != token) {
    return Error(string("'") + static_cast<char>(token) + "' expected");
  }
  Next();
  return Status::OK;
}

Status StatementParser::ExpectEnd() {
  if (!AtEnd()) return Error("';' expected");
  return Status::OK;
}

Status StatementParser::ParseFileName(string *filename) {
  filename->clear();
  Next();
  while (input_->token() != '"') {
    if (AtEnd() || input_->error()) return Error("unterminated file name");
    filename->append(input_->token_text());
    Next();
  }
  Next();
  if (filename->empty()) return Error("empty file name");
  return Status::OK;
}

Status StatementParser::ParseName(const char *what, string *name) {
  switch (input_->token()) {
    case ProgramTokenizer::WORD_TOKEN:
      *name = input_->token_text();
      Next();
      return Status::OK;
    case ProgramTokenizer::QUOTED_TOKEN:
      *name = ProgramTokenizer::Unquote(input_->token_text());
      Next();
      return Status::OK;
    case '"':
      return ParseFileName(name);
    default:
      return Error(string(what) + " expected");
  }
}

Status StatementParser::ReadLines(const string &filename,
                                  std::vector<string> *lines) {
  Status st = ReadResourceLines(filename, lines);
  if (!st.ok()) {
    return Error("error when reading " + filename + ": " + st.ToString());
  }
  return Status::OK;
}

Status StatementParser::Parse(Statement **statement) {
  *statement = nullptr;
  if (input_->error()) return Error("");
  if (input_->token() != ProgramTokenizer::WORD_TOKEN) {
    keyword_ = input_->token_text();
    return Error("statement keyword expected");
  }
  keyword_ = input_->token_text();
  Next();

  Status st;
  string name;
  if (keyword_ == "declareSpanType") {
    st = ParseName("type name", &name);
    if (!st.ok()) return st;
    st = ExpectEnd();
    if (!st.ok()) return st;
    *statement = new DeclareStatement(name);
  } else if (keyword_ == "provide") {
    st = ParseName("type name", &name);
    if (!st.ok()) return st;
    st = ExpectEnd();
    if (!st.ok()) return st;
    *statement = new ProvideStatement(name);
  } else if (keyword_ == "require") {
    st = ParseName("type name", &name);
    if (!st.ok()) return st;
    string file;
    if (input_->token() == ',') {
      Next();
      st = ParseName("file name", &file);
      if (!st.ok()) return st;
    }
    st = ExpectEnd();
    if (!st.ok()) return st;
    *statement = new RequireStatement(name, file);
  } else if (keyword_ == "annotateWith") {
    st = ParseName("file name", &name);
    if (!st.ok()) return st;
    st = ExpectEnd();
    if (!st.ok()) return st;
    *statement = new AnnotateWithStatement(name);
  } else if (keyword_ == "onLevel") {
    st = ParseName("level name", &name);
    if (!st.ok()) return st;
    st = ExpectEnd();
    if (!st.ok()) return st;
    *statement = new OnLevelStatement(name);
  } else if (keyword_ == "offLevel") {
    // The level argument is optional and ignored.
    if (AtName()) {
      st = ParseName("level name", &name);
      if (!st.ok()) return st;
    }
    st = ExpectEnd();
    if (!st.ok()) return st;
    *statement = new OffLevelStatement();
  } else if (keyword_ == "importFromLevel") {
    return ParseImport(statement);
  } else if (keyword_ == "defDict") {
    return ParseDictionary(statement);
  } else if (keyword_ == "defLevel") {
    return ParseLevel(statement);
  } else if (keyword_ == "defSpanType") {
    return ParseLabeling(LabelingStatement::SPAN_TYPE, statement);
  } else if (keyword_ == "defSpanProp") {
    return ParseLabeling(LabelingStatement::SPAN_PROPERTY, statement);
  } else if (keyword_ == "defTokenProp") {
    return ParseLabeling(LabelingStatement::TOKEN_PROPERTY, statement);
  } else {
    return Error("unknown keyword");
  }
  return Status::OK;
}

Status StatementParser::ParseImport(Statement **statement) {
  string level, new_type, old_type;
  Status st = ParseName("level name", &level);
  if (!st.ok()) return st;
  st = ParseName("type name", &new_type);
  if (!st.ok()) return st;
  st = Expect('=');
  if (!st.ok()) return st;
  st = ParseName("type name", &old_type);
  if (!st.ok()) return st;
  st = ExpectEnd();
  if (!st.ok()) return st;
  *statement = new ImportFromLevelStatement(level, new_type, old_type);
  return Status::OK;
}

Status StatementParser::ParseDictionary(Statement **statement) {
  bool ignore_case = true;
  if (input_->token() == '+') {
    Next();
    if (!input_->IsWord("case")) return Error("'case' expected after '+'");
    Next();
    ignore_case = false;
  }
  string name;
  Status st = ParseName("dictionary name", &name);
  if (!st.ok()) return st;
  st = Expect('=');
  if (!st.ok()) return st;

  DefDictStatement *dict = new DefDictStatement(name, ignore_case);
  for (;;) {
    if (input_->token() == '"') {
      string filename;
      std::vector<string> lines;
      st = ParseFileName(&filename);
      if (st.ok()) st = ReadLines(filename, &lines);
      if (!st.ok()) {
        delete dict;
        return st;
      }
      dict->AddFile(filename, lines);
    } else if (input_->token() == ProgramTokenizer::WORD_TOKEN ||
               input_->token() == ProgramTokenizer::QUOTED_TOKEN) {
      dict->AddWord(ProgramTokenizer::Unquote(input_->token_text()));
      Next();
    } else {
      delete dict;
      return Error("dictionary word expected");
    }

    if (AtEnd()) break;
    if (input_->token() != ',') {
      delete dict;
      return Error("expected comma");
    }
    Next();
  }

  *statement = dict;
  return Status::OK;
}

Status StatementParser::ParseLevel(Statement **statement) {
  string name;
  Status st = ParseName("level name", &name);
  if (!st.ok()) return st;
  st = Expect('=');
  if (!st.ok()) return st;

  if (input_->token() != ProgramTokenizer::WORD_TOKEN ||
      !Retokenizer::IsRegistered(input_->token_text())) {
    return Error("level strategy expected");
  }
  string strategy = input_->token_text();
  Next();

  string pattern;
  st = ParseName("level pattern", &pattern);
  if (!st.ok()) return st;

  // Check regular expression for the splitting strategies.
  if (strategy != "pseudotoken") {
    RegExp regex;
    st = regex.Compile(pattern);
    if (!st.ok()) return Error(st.message());
  }

  st = ExpectEnd();
  if (!st.ok()) return st;
  *statement = new DefLevelStatement(name, strategy, pattern);
  return Status::OK;
}

// Checks if token starts a generator.
static bool IsGeneratorStart(int token) {
  return token == ':' || token == '-' || token == '~';
}

Status StatementParser::ParseLabeling(LabelingStatement::Effect effect,
                                      Statement **statement) {
  string name, value;
  Status st = ParseName(effect == LabelingStatement::SPAN_TYPE ?
                        "type name" : "property name", &name);
  if (!st.ok()) return st;

  if (effect == LabelingStatement::SPAN_TYPE) {
    if (input_->token() == ':') return Error("can't define properties here");
  } else {
    if (input_->token() != ':') return Error("':' expected after property");
    Next();
    st = ParseName("property value", &value);
    if (!st.ok()) return st;
  }
  st = Expect('=');
  if (!st.ok()) return st;

  // Scope is given by an optional type before the generator.
  string scope;
  if (!IsGeneratorStart(input_->token())) {
    st = ParseName("scope type", &scope);
    if (!st.ok()) return st;
    if (!IsGeneratorStart(input_->token())) {
      return Error("expected ':', '-' or '~'");
    }
  }

  Generator *generator = nullptr;
  int start = input_->token();
  Next();
  if (start == ':' || start == '-') {
    Pattern *pattern = new Pattern();
    st = pattern->Parse(input_);
    if (!st.ok()) {
      delete pattern;
      return Error(st.message());
    }
    if (start == ':') {
      generator = new MatchGenerator(pattern);
    } else {
      generator = new FilterGenerator(pattern);
    }
  } else if (input_->IsWord("re")) {
    Next();
    st = ParseRegex(&generator);
    if (!st.ok()) return st;
  } else if (input_->IsWord("trie")) {
    Next();
    st = ParseTrie(&generator);
    if (!st.ok()) return st;
  } else {
    return Error("expected 're' or 'trie'");
  }

  st = ExpectEnd();
  if (!st.ok()) {
    delete generator;
    return st;
  }
  *statement = new LabelingStatement(effect, name, value, scope, generator);
  return Status::OK;
}

Status StatementParser::ParseRegex(Generator **generator) {
  if (input_->token() != ProgramTokenizer::QUOTED_TOKEN) {
    return Error("quoted regular expression expected");
  }
  string regex = ProgramTokenizer::Unquote(input_->token_text());
  Next();
  Status st = Expect(',');
  if (!st.ok()) return st;

  int32 group;
  if (input_->token() != ProgramTokenizer::WORD_TOKEN ||
      !safe_strto32(input_->token_text(), &group)) {
    return Error("expected a regex group number and saw '" +
                 input_->token_text() + "'");
  }
  Next();

  RegexGenerator *regex_generator = new RegexGenerator();
  st = regex_generator->Init(regex, group);
  if (!st.ok()) {
    delete regex_generator;
    return Error(st.message());
  }
  *generator = regex_generator;
  return Status::OK;
}

Status StatementParser::ParseTrie(Generator **generator) {
  // Collect comma-separated phrases. The last phrase is terminated by the
  // end of the statement.
  struct Word {
    int token;
    string text;
  };
  std::vector<std::vector<Word>> phrases(1);
  while (!AtEnd()) {
    if (input_->error()) return Error("");
    if (input_->token() == ',') {
      phrases.emplace_back();
    } else {
      phrases.back().push_back(Word{input_->token(), input_->token_text()});
    }
    Next();
  }

  TrieGenerator *trie = new TrieGenerator();
  for (int i = 0; i < phrases.size(); ++i) {
    const std::vector<Word> &phrase = phrases[i];
    if (phrase.size() > 2 && phrase.front().token == '"' &&
        phrase.back().token == '"') {
      // Phrase file.
      string filename;
      for (int j = 1; j < phrase.size() - 1; ++j) {
        filename.append(phrase[j].text);
      }
      std::vector<string> lines;
      Status st = ReadLines(filename, &lines);
      if (!st.ok()) {
        delete trie;
        return st;
      }
      trie->AddPhraseFile(filename, lines);
    } else {
      std::vector<string> words;
      for (const Word &word : phrase) {
        words.push_back(ProgramTokenizer::Unquote(word.text));
      }
      trie->AddPhrase("phrase#" + std::to_string(i), words);
    }
  }

  *generator = trie;
  return Status::OK;
}

}  // namespace

Status Statement::Parse(ProgramTokenizer *input, Statement **statement) {
  StatementParser parser(input);
  return parser.Parse(statement);
}

}  // namespace nlp
}  // namespace spanlab
