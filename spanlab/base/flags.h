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


#ifndef SPANLAB_BASE_FLAGS_H_
#define SPANLAB_BASE_FLAGS_H_

#include <string>

#include "spanlab/base/types.h"

namespace spanlab {

// Command line flag. Flags are defined at file scope with the DEFINE_xxx
// macros and are linked into a global list when the program starts.
struct Flag {
  // Flag value types.
  enum Type {BOOL, INT32, STRING};

  // Registers flag.
  Flag(const char *name, Type type, const char *help, void *storage);

  // Returns flag value.
  template<typename T> T &value() {
    return *reinterpret_cast<T *>(storage);
  }
  template<typename T> const T &value() const {
    return *reinterpret_cast<const T *>(storage);
  }

  // Sets flag value from text. Returns false if the text is not a valid
  // value for the flag type.
  bool Set(const char *text);

  // Returns current flag value as text.
  string ToString() const;

  // Finds flag by name. Returns null if there is no such flag.
  static Flag *Find(const char *name);

  // Sets usage message printed by --help.
  static void SetUsageMessage(const string &usage);

  // Parses and removes flags from the command line. Returns zero on success
  // or the index of the offending argument.
  static int ParseCommandLineFlags(int *argc, char **argv);

  // Prints usage message and the list of flags.
  static void PrintHelp();

  const char *name;      // flag name
  Type type;             // value type
  const char *help;      // description of flag
  void *storage;         // flag variable
  Flag *next;            // next flag in list

  static Flag *head;     // first registered flag
  static Flag *tail;     // last registered flag
};

#define DEFINE_VARIABLE(type, fltype, name, value, help) \
  type FLAGS_##name = value; \
  static spanlab::Flag flags_##name(#name, fltype, help, &FLAGS_##name);

#define DEFINE_bool(name, value, help) \
  DEFINE_VARIABLE(bool, ::spanlab::Flag::BOOL, name, value, help)

#define DEFINE_int32(name, value, help) \
  DEFINE_VARIABLE(::spanlab::int32, ::spanlab::Flag::INT32, name, value, help)

#define DEFINE_string(name, value, help) \
  DEFINE_VARIABLE(std::string, ::spanlab::Flag::STRING, name, value, help)

#define DECLARE_VARIABLE(type, name) extern type FLAGS_##name;

#define DECLARE_string(name) DECLARE_VARIABLE(std::string, name)

}  // namespace spanlab

#endif  // SPANLAB_BASE_FLAGS_H_
