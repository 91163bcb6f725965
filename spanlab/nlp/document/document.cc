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


#include "spanlab/nlp/document/document.h"

#include <ostream>
#include <string>

namespace spanlab {
namespace nlp {

const Token &Span::token(int index) const {
  DCHECK_GE(index, 0);
  DCHECK_LT(index, length());
  return document_->token(begin_ + index);
}

int Span::char_begin() const {
  return document_->TokenBegin(begin_);
}

int Span::char_end() const {
  if (empty()) return char_begin();
  return document_->token(end_ - 1).end();
}

Text Span::GetText() const {
  int begin = char_begin();
  return document_->GetText(begin, char_end());
}

bool Span::CharIndexProperSubSpan(int lo, int hi, Span *subspan) const {
  int base = char_begin();
  int first = -1;
  int last = -1;
  for (int i = begin_; i < end_; ++i) {
    const Token &t = document_->token(i);
    int tb = t.begin() - base;
    int te = t.end() - base;
    if (tb >= lo && te <= hi) {
      if (first == -1) first = i;
      last = i;
    } else if (first != -1) {
      break;
    }
  }
  if (first == -1) return false;
  *subspan = Span(document_, first, last + 1);
  return true;
}

bool Span::operator<(const Span &other) const {
  int d1 = document_ == nullptr ? -1 : document_->index();
  int d2 = other.document_ == nullptr ? -1 : other.document_->index();
  if (d1 != d2) return d1 < d2;
  if (begin_ != other.begin_) return begin_ < other.begin_;
  return end_ < other.end_;
}

std::ostream &operator<<(std::ostream &out, const Span &span) {
  if (span.document() == nullptr) {
    out << "<nil>";
  } else {
    out << span.document()->id() << "[" << span.begin() << ":" << span.end()
        << "] '" << span.GetText() << "'";
  }
  return out;
}

void Document::AddToken(int begin, int end) {
  DCHECK_LE(0, begin);
  DCHECK_LE(begin, end);
  DCHECK_LE(end, static_cast<int>(text_.size()));
  tokens_.emplace_back();
  Token &token = tokens_.back();
  token.document_ = this;
  token.index_ = tokens_.size() - 1;
  token.begin_ = begin;
  token.end_ = end;
  token.word_.assign(text_, begin, end - begin);
}

}  // namespace nlp
}  // namespace spanlab
