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


#ifndef SPANLAB_NLP_PROGRAM_STATEMENT_H_
#define SPANLAB_NLP_PROGRAM_STATEMENT_H_

#include <set>
#include <string>
#include <vector>

#include "spanlab/base/macros.h"
#include "spanlab/base/status.h"
#include "spanlab/base/types.h"
#include "spanlab/nlp/document/document.h"
#include "spanlab/nlp/labels/labels.h"
#include "spanlab/nlp/program/generator.h"
#include "spanlab/nlp/program/program-tokenizer.h"

namespace spanlab {
namespace nlp {

// Evaluation context for running statements against a label store. The
// context keeps track of the current level.
class Evaluation {
 public:
  // Initializes evaluation with the layer as the current level.
  Evaluation(Labels *labels, Layer *layer) : labels_(labels), layer_(layer) {}

  // Label store.
  Labels *labels() const { return labels_; }

  // Layer for the current level.
  Layer *layer() const { return layer_; }

  // Switches to a level. Returns an error if there is no such level.
  Status OnLevel(const string &name);

  // Switches back to the original level.
  void OffLevel() { layer_ = labels_->original(); }

 private:
  Labels *labels_;
  Layer *layer_;
};

// A statement in a labeling program.
class Statement {
 public:
  // Statement kinds.
  enum Kind {
    DECLARE,
    PROVIDE,
    REQUIRE,
    ANNOTATE_WITH,
    DEF_DICT,
    DEF_LEVEL,
    ON_LEVEL,
    OFF_LEVEL,
    IMPORT_FROM_LEVEL,
    LABELING,
  };

  virtual ~Statement() = default;

  // Returns statement kind.
  virtual Kind kind() const = 0;

  // Executes statement.
  virtual Status Execute(Evaluation *eval) const = 0;

  // Returns statement in source form without the terminating semicolon.
  virtual string ToString() const = 0;

  // Parses the statement starting at the current input token. The input is
  // left at the token terminating the statement. The caller takes ownership
  // of the returned statement.
  static Status Parse(ProgramTokenizer *input, Statement **statement);
};

// declareSpanType TYPE
class DeclareStatement : public Statement {
 public:
  explicit DeclareStatement(const string &type) : type_(type) {}

  Kind kind() const override { return DECLARE; }
  Status Execute(Evaluation *eval) const override;
  string ToString() const override;

  const string &type() const { return type_; }

 private:
  string type_;
};

// provide TYPE
class ProvideStatement : public Statement {
 public:
  explicit ProvideStatement(const string &type) : type_(type) {}

  Kind kind() const override { return PROVIDE; }
  Status Execute(Evaluation *eval) const override;
  string ToString() const override;

  const string &type() const { return type_; }

 private:
  string type_;
};

// require TYPE [, FILE]
class RequireStatement : public Statement {
 public:
  RequireStatement(const string &type, const string &file)
      : type_(type), file_(file) {}

  Kind kind() const override { return REQUIRE; }
  Status Execute(Evaluation *eval) const override;
  string ToString() const override;

  const string &type() const { return type_; }
  const string &file() const { return file_; }

 private:
  string type_;
  string file_;
};

// annotateWith FILE
class AnnotateWithStatement : public Statement {
 public:
  explicit AnnotateWithStatement(const string &file) : file_(file) {}

  Kind kind() const override { return ANNOTATE_WITH; }
  Status Execute(Evaluation *eval) const override;
  string ToString() const override;

  const string &file() const { return file_; }

 private:
  string file_;
};

// defDict [+case] NAME = ENTRY, ENTRY, ...
class DefDictStatement : public Statement {
 public:
  DefDictStatement(const string &name, bool ignore_case)
      : name_(name), ignore_case_(ignore_case) {}

  // Adds word to dictionary. The word is lower-cased for case-insensitive
  // dictionaries.
  void AddWord(const string &word);

  // Adds the lines of a dictionary file.
  void AddFile(const string &filename, const std::vector<string> &lines);

  Kind kind() const override { return DEF_DICT; }
  Status Execute(Evaluation *eval) const override;
  string ToString() const override;

  const string &name() const { return name_; }
  bool ignore_case() const { return ignore_case_; }
  const std::set<string> &words() const { return words_; }

 private:
  string name_;
  bool ignore_case_;

  // Dictionary words.
  std::set<string> words_;

  // Dictionary entries in source form.
  std::vector<string> entries_;
};

// defLevel NAME = STRATEGY PATTERN
class DefLevelStatement : public Statement {
 public:
  DefLevelStatement(const string &name, const string &strategy,
                    const string &pattern)
      : name_(name), strategy_(strategy), pattern_(pattern) {}

  Kind kind() const override { return DEF_LEVEL; }
  Status Execute(Evaluation *eval) const override;
  string ToString() const override;

  const string &name() const { return name_; }
  const string &strategy() const { return strategy_; }
  const string &pattern() const { return pattern_; }

 private:
  string name_;
  string strategy_;
  string pattern_;
};

// onLevel NAME
class OnLevelStatement : public Statement {
 public:
  explicit OnLevelStatement(const string &name) : name_(name) {}

  Kind kind() const override { return ON_LEVEL; }
  Status Execute(Evaluation *eval) const override;
  string ToString() const override;

  const string &name() const { return name_; }

 private:
  string name_;
};

// offLevel [NAME]
class OffLevelStatement : public Statement {
 public:
  Kind kind() const override { return OFF_LEVEL; }
  Status Execute(Evaluation *eval) const override;
  string ToString() const override;
};

// importFromLevel LEVEL NEWTYPE = OLDTYPE
class ImportFromLevelStatement : public Statement {
 public:
  ImportFromLevelStatement(const string &level, const string &new_type,
                           const string &old_type)
      : level_(level), new_type_(new_type), old_type_(old_type) {}

  Kind kind() const override { return IMPORT_FROM_LEVEL; }
  Status Execute(Evaluation *eval) const override;
  string ToString() const override;

  const string &level() const { return level_; }
  const string &new_type() const { return new_type_; }
  const string &old_type() const { return old_type_; }

 private:
  string level_;
  string new_type_;
  string old_type_;
};

// Statement that runs a generator over the input spans of a scope and labels
// the output spans:
//   defSpanType TYPE = [SCOPE] GEN
//   defSpanProp PROP:VALUE = [SCOPE] GEN
//   defTokenProp PROP:VALUE = [SCOPE] GEN
class LabelingStatement : public Statement {
 public:
  // Labeling effects.
  enum Effect {
    SPAN_TYPE,       // add span to type
    SPAN_PROPERTY,   // set property on span
    TOKEN_PROPERTY,  // set property on every token in span
  };

  // Initializes statement. The value is only used for properties. An empty
  // scope means the whole documents. Takes ownership of the generator.
  LabelingStatement(Effect effect, const string &name, const string &value,
                    const string &scope, Generator *generator)
      : effect_(effect), name_(name), value_(value), scope_(scope),
        generator_(generator) {}
  ~LabelingStatement() override { delete generator_; }

  Kind kind() const override { return LABELING; }
  Status Execute(Evaluation *eval) const override;
  string ToString() const override;

  Effect effect() const { return effect_; }

  // Type name for SPAN_TYPE and property name for the other effects.
  const string &name() const { return name_; }
  const string &value() const { return value_; }

  // Scope type or empty for whole documents.
  const string &scope() const { return scope_; }

  const Generator *generator() const { return generator_; }

 private:
  // Applies statement effect to span.
  void Extend(Layer *layer, const Span &span) const;

  Effect effect_;
  string name_;
  string value_;
  string scope_;
  Generator *generator_;

  DISALLOW_COPY_AND_ASSIGN(LabelingStatement);
};

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_PROGRAM_STATEMENT_H_
