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


#include "spanlab/nlp/labels/labels-io.h"

#include <string>
#include <vector>

#include "spanlab/base/logging.h"
#include "spanlab/file/file.h"
#include "spanlab/nlp/labels/errors.h"
#include "spanlab/string/numbers.h"
#include "spanlab/string/strip.h"

namespace spanlab {
namespace nlp {

string AddToTypeOp(const Span &span, const string &type) {
  int begin = span.char_begin();
  int length = span.char_end() - begin;
  return "addToType " + span.document()->id() + " " +
         std::to_string(begin) + " " + std::to_string(length) + " " + type;
}

Status SaveTypesAsOps(const Layer &layer, const string &filename) {
  File *f;
  Status st = File::Open(filename, "w", &f);
  if (!st.ok()) return st;

  std::vector<string> types;
  layer.Types(&types);
  for (const string &type : types) {
    for (const Span &span : *layer.InstancesOf(type)) {
      st = f->WriteLine(AddToTypeOp(span, type));
      if (!st.ok()) {
        f->Close();
        return st;
      }
    }
  }

  return f->Close();
}

Status LoadTypesFromOps(const string &filename, Layer *layer) {
  string contents;
  Status st = File::ReadContents(filename, &contents);
  if (!st.ok()) return st;
  std::vector<string> lines;
  SplitLines(contents, &lines);

  const Corpus *corpus = layer->corpus();
  for (int i = 0; i < lines.size(); ++i) {
    Text line = StripWhiteSpace(lines[i]);
    if (line.empty()) continue;

    // Split line into fields.
    std::vector<string> fields;
    for (ssize_t pos = 0; pos < line.size();) {
      ssize_t end = line.find(' ', pos);
      if (end == Text::npos) end = line.size();
      if (end > pos) fields.push_back(line.substr(pos, end - pos).str());
      pos = end + 1;
    }

    string location = filename + ":" + std::to_string(i + 1);
    int32 begin, length;
    if (fields.size() != 5 || fields[0] != "addToType" ||
        !safe_strto32(fields[2], &begin) ||
        !safe_strto32(fields[3], &length)) {
      return ResourceError("Malformed operation at " + location);
    }

    // Map byte range onto tokens.
    const Document *document = corpus->Find(fields[1]);
    if (document == nullptr) {
      return ResourceError("Unknown document " + fields[1] + " at " +
                           location);
    }
    Span whole = document->GetSpan();
    Span span;
    if (whole.empty()) continue;
    int base = whole.char_begin();
    if (!whole.CharIndexProperSubSpan(begin - base, begin + length - base,
                                      &span)) {
      LOG(WARNING) << "No tokens for operation at " << location;
      continue;
    }
    layer->AddToType(span, fields[4]);
  }

  return Status::OK;
}

}  // namespace nlp
}  // namespace spanlab
