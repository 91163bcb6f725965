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


#include "spanlab/base/flags.h"

#include <stdlib.h>
#include <string.h>
#include <iostream>

DEFINE_bool(help, false, "Print help message");

namespace spanlab {

Flag *Flag::head = nullptr;
Flag *Flag::tail = nullptr;

// Program usage message and program name.
static string usage_message;
static string program_name;

// Names of flag types for help and error messages.
static const char *type_name[] = {"bool", "int32", "string"};

Flag::Flag(const char *name, Type type, const char *help, void *storage)
    : name(name), type(type), help(help), storage(storage), next(nullptr) {
  if (head == nullptr) {
    head = tail = this;
  } else {
    tail->next = this;
    tail = this;
  }
}

bool Flag::Set(const char *text) {
  switch (type) {
    case BOOL:
      if (text == nullptr) {
        value<bool>() = true;
        return true;
      }
      for (const char *t : {"1", "t", "true", "y", "yes"}) {
        if (strcasecmp(text, t) == 0) {
          value<bool>() = true;
          return true;
        }
      }
      for (const char *f : {"0", "f", "false", "n", "no"}) {
        if (strcasecmp(text, f) == 0) {
          value<bool>() = false;
          return true;
        }
      }
      return false;

    case INT32: {
      if (text == nullptr || *text == '\0') return false;
      char *end;
      long n = strtol(text, &end, 10);
      if (*end != '\0') return false;
      value<int32>() = n;
      return true;
    }

    case STRING:
      if (text == nullptr) return false;
      value<string>() = text;
      return true;
  }
  return false;
}

string Flag::ToString() const {
  switch (type) {
    case BOOL: return value<bool>() ? "true" : "false";
    case INT32: return std::to_string(value<int32>());
    case STRING: return value<string>();
  }
  return "";
}

Flag *Flag::Find(const char *name) {
  for (Flag *f = head; f != nullptr; f = f->next) {
    if (strcmp(name, f->name) == 0) return f;
  }
  return nullptr;
}

void Flag::SetUsageMessage(const string &usage) {
  usage_message = usage;
}

int Flag::ParseCommandLineFlags(int *argc, char **argv) {
  if (*argc > 0) program_name = argv[0];
  int rc = 0;
  int i = 1;
  while (i < *argc) {
    char *arg = argv[i];
    if (arg[0] != '-' || arg[1] == '\0') {
      i++;
      continue;
    }

    // Strip dashes. A lone -- ends the flags.
    int first = i++;
    char *name = arg + 1;
    if (*name == '-') name++;
    if (*name == '\0') {
      argv[first] = nullptr;
      break;
    }

    // Split name=value.
    const char *text = nullptr;
    char *eq = strchr(name, '=');
    if (eq != nullptr) {
      *eq = '\0';
      text = eq + 1;
    }

    // Boolean flags can be negated with a no prefix.
    Flag *flag = Find(name);
    bool negated = false;
    if (flag == nullptr && strncmp(name, "no", 2) == 0) {
      flag = Find(name + 2);
      negated = flag != nullptr && flag->type == BOOL && text == nullptr;
      if (!negated) flag = nullptr;
    }
    if (flag == nullptr) {
      std::cerr << "Error: unrecognized flag " << arg << "\n"
                << "Try --help for options\n";
      rc = first;
      break;
    }

    // Non-boolean flags take their value from the next argument if needed.
    if (text == nullptr && flag->type != BOOL) {
      if (i == *argc) {
        std::cerr << "Error: missing value for flag " << arg << " of type "
                  << type_name[flag->type] << "\n";
        rc = first;
        break;
      }
      text = argv[i++];
    }

    bool ok = negated ? flag->Set("false") : flag->Set(text);
    if (!ok) {
      std::cerr << "Error: illegal value for flag " << arg << " of type "
                << type_name[flag->type] << "\nTry --help for options\n";
      rc = first;
      break;
    }

    // Remove flag from command line.
    for (int j = first; j < i; ++j) argv[j] = nullptr;
  }

  // Compact remaining arguments.
  int n = 1;
  for (int j = 1; j < *argc; ++j) {
    if (argv[j] != nullptr) argv[n++] = argv[j];
  }
  *argc = n;

  if (FLAGS_help) {
    PrintHelp();
    exit(0);
  }
  return rc;
}

void Flag::PrintHelp() {
  if (!usage_message.empty()) {
    std::cout << usage_message << "\n";
  } else if (!program_name.empty()) {
    std::cout << program_name << " [OPTIONS]\n";
  }
  if (head == nullptr) return;
  std::cout << "Options:\n";
  for (Flag *f = head; f != nullptr; f = f->next) {
    std::cout << "  --" << f->name << " (" << f->help << ")\n"
              << "        type: " << type_name[f->type]
              << "  default: " << f->ToString() << "\n";
  }
}

}  // namespace spanlab
