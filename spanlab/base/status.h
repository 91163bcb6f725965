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

#ifndef SPANLAB_BASE_STATUS_H_
#define SPANLAB_BASE_STATUS_H_

#include <ostream>
#include <string>

#include "spanlab/base/logging.h"
#include "spanlab/base/types.h"

namespace spanlab {

// Result of an operation. A status is either OK or carries a non-zero error
// code with a message. Error codes below 1000 are errno values from the file
// layer, the engine's own codes are in nlp/labels/errors.h.
class Status {
 public:
  Status() : error_(nullptr) {}
  Status(int code, const char *message);
  Status(int code, const string &message);

  // Error with the message "context: detail".
  Status(int code, const char *context, const char *detail);
  Status(int code, const char *context, const string &detail);

  Status(const Status &other) : error_(Clone(other.error_)) {}
  ~Status() { delete error_; }

  Status &operator=(const Status &other) {
    if (this != &other) {
      delete error_;
      error_ = Clone(other.error_);
    }
    return *this;
  }

  bool ok() const { return error_ == nullptr; }

  // Converts to true for success. A failed status is logged as an error,
  // which lets callers write CHECK(File::Open(...)).
  operator bool() const {
    if (error_ != nullptr) LOG(ERROR) << ToString();
    return error_ == nullptr;
  }

  int code() const { return error_ == nullptr ? 0 : error_->code; }
  const char *message() const {
    return error_ == nullptr ? "" : error_->message.c_str();
  }

  // Returns "OK" or "ERROR <code> : <message>".
  string ToString() const;

  static const Status &OK;

 private:
  struct Error {
    int code;
    string message;
  };

  static Error *Clone(const Error *error) {
    return error == nullptr ? nullptr : new Error(*error);
  }

  // Null for success.
  Error *error_;
};

inline std::ostream &operator<<(std::ostream &out, const Status &status) {
  return out << status.ToString();
}

}  // namespace spanlab

#endif  // SPANLAB_BASE_STATUS_H_
