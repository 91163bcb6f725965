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

#include "spanlab/base/status.h"

#include <string>

namespace spanlab {

static const Status kSuccess;
const Status &Status::OK = kSuccess;

Status::Status(int code, const char *message)
    : error_(new Error{code, message}) {
  DCHECK_NE(code, 0);
}

Status::Status(int code, const string &message)
    : error_(new Error{code, message}) {
  DCHECK_NE(code, 0);
}

Status::Status(int code, const char *context, const char *detail)
    : error_(new Error{code, string(context) + ": " + detail}) {
  DCHECK_NE(code, 0);
}

Status::Status(int code, const char *context, const string &detail)
    : Status(code, context, detail.c_str()) {}

string Status::ToString() const {
  if (error_ == nullptr) return "OK";
  return "ERROR " + std::to_string(error_->code) + " : " + error_->message;
}

}  // namespace spanlab
