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


#ifndef SPANLAB_NLP_DOCUMENT_DOCUMENT_H_
#define SPANLAB_NLP_DOCUMENT_DOCUMENT_H_

#include <iosfwd>
#include <string>
#include <vector>

#include "spanlab/base/logging.h"
#include "spanlab/base/macros.h"
#include "spanlab/base/types.h"
#include "spanlab/string/text.h"

namespace spanlab {
namespace nlp {

class Document;

// A token represents a range of characters in the document text. A token is a
// word or any other kind of lexical unit like punctuation, number, etc.
class Token {
 public:
  // Document that the token belongs to.
  const Document *document() const { return document_; }

  // Index of token in document.
  int index() const { return index_; }

  // Text span for token in document text. The [begin;end[ is a semi-open byte
  // range of the UTF-8 encoded token in the document text.
  int begin() const { return begin_; }
  int end() const { return end_; }
  int size() const { return end_ - begin_; }

  // Token word.
  const string &word() const { return word_; }

 private:
  const Document *document_;    // document the token belongs to
  int index_;                   // index of token in document
  int begin_;                   // first byte position of token
  int end_;                     // first byte position after token
  string word_;                 // token word

  friend class Document;
};

// A span is a range of tokens in a document. Spans are values; two spans are
// equal if they cover the same tokens in the same document. Spans are ordered
// by document, then begin token, then end token.
class Span {
 public:
  Span() : document_(nullptr), begin_(0), end_(0) {}
  Span(const Document *document, int begin, int end)
      : document_(document), begin_(begin), end_(end) {}

  // Returns the document that that the span belongs to.
  const Document *document() const { return document_; }

  // Returns the begin and end token. This is a half-open interval, so the
  // span covers the tokens in the range [begin;end[.
  int begin() const { return begin_; }
  int end() const { return end_; }

  // Returns the length of the spans in number of tokens.
  int length() const { return end_ - begin_; }
  bool empty() const { return end_ == begin_; }

  // Returns token in span. The index is relative to the start of the span.
  const Token &token(int index) const;

  // Returns the byte range covered by the span. An empty span starts and ends
  // at the position of the token following it.
  int char_begin() const;
  int char_end() const;

  // Returns text for span. This is the document text from the start of the
  // first token to the end of the last token.
  Text GetText() const;

  // Returns sub-span with token positions relative to the start of the span.
  Span SubSpan(int begin, int end) const {
    DCHECK_LE(0, begin);
    DCHECK_LE(begin, end);
    DCHECK_LE(end, length());
    return Span(document_, begin_ + begin, begin_ + end);
  }

  // Finds the largest sub-span whose tokens all lie within the byte range
  // [lo;hi[ relative to the span text. Returns false if no token is properly
  // contained in the range.
  bool CharIndexProperSubSpan(int lo, int hi, Span *subspan) const;

  // Returns true if this span contains the other span.
  bool Contains(const Span &other) const {
    return document_ == other.document_ &&
           begin_ <= other.begin_ && end_ >= other.end_;
  }

  // Returns true if this span contains the token.
  bool Contains(int token) const {
    return begin_ <= token && token < end_;
  }

  // Span comparison.
  bool operator==(const Span &other) const {
    return document_ == other.document_ &&
           begin_ == other.begin_ && end_ == other.end_;
  }
  bool operator!=(const Span &other) const { return !(*this == other); }
  bool operator<(const Span &other) const;

 private:
  const Document *document_;
  int begin_;
  int end_;
};

// Output span to stream.
std::ostream &operator<<(std::ostream &out, const Span &span);

// A document has an identifier, a text, and a sequence of tokens over the
// text. The index is the position of the document in its corpus.
class Document {
 public:
  Document(const string &id, const string &text, int index)
      : id_(id), text_(text), index_(index) {}

  // Document identifier.
  const string &id() const { return id_; }

  // Document text.
  const string &text() const { return text_; }

  // Position of document in corpus.
  int index() const { return index_; }

  // Adds token for the byte range [begin;end[ of the text.
  void AddToken(int begin, int end);

  // Returns the number of tokens in the document.
  int num_tokens() const { return tokens_.size(); }

  // Returns token in document.
  const Token &token(int index) const { return tokens_[index]; }
  const std::vector<Token> &tokens() const { return tokens_; }

  // Returns span covering the whole document.
  Span GetSpan() const { return Span(this, 0, num_tokens()); }

  // Returns text for a byte range of the document.
  Text GetText(int begin, int end) const {
    return Text(text_.data() + begin, end - begin);
  }

  // Returns the byte position of the start of a token. For the position after
  // the last token the end of the text is returned.
  int TokenBegin(int index) const {
    if (index < num_tokens()) return tokens_[index].begin();
    return text_.size();
  }

 private:
  // Document identifier.
  string id_;

  // Document text.
  string text_;

  // Position of document in corpus.
  int index_;

  // Document tokens.
  std::vector<Token> tokens_;

  DISALLOW_COPY_AND_ASSIGN(Document);
};

}  // namespace nlp
}  // namespace spanlab

#endif  // SPANLAB_NLP_DOCUMENT_DOCUMENT_H_
