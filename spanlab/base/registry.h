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

// Named registries of pluggable implementations. A base class derives from
// Component<T> when each use needs a fresh instance, or from Singleton<T> when
// one shared instance per implementation is enough. Implementations register
// themselves at static initialization time:
//
//   class Retokenizer : public Component<Retokenizer> { ... };
//   REGISTER_COMPONENT_REGISTRY("retokenizer", Retokenizer);
//   REGISTER_COMPONENT_TYPE(Retokenizer, "split", SplitRetokenizer);
//
//   Retokenizer *r = Retokenizer::Create("split");

#ifndef SPANLAB_BASE_REGISTRY_H_
#define SPANLAB_BASE_REGISTRY_H_

#include <string.h>
#include <functional>
#include <string>

#include "spanlab/base/logging.h"
#include "spanlab/base/types.h"

namespace spanlab {

// Registry holding a list of objects of type T keyed by type name.
template <class T> struct ComponentRegistry {
  // Each registration links one entry into the list of the registry.
  class Registrar {
   public:
    Registrar(ComponentRegistry<T> *registry, const char *type,
              const char *class_name, T *object)
        : type_(type), class_name_(class_name), object_(object),
          next_(registry->components) {
      registry->components = this;
    }

    const char *type() const { return type_; }
    const char *class_name() const { return class_name_; }
    T *object() const { return object_; }
    Registrar *next() const { return next_; }

   private:
    const char *type_;
    const char *class_name_;
    T *object_;
    Registrar *next_;
  };

  // Returns the registration for a type, or null if it is unknown.
  const Registrar *Find(const char *type) const {
    for (Registrar *r = components; r != nullptr; r = r->next()) {
      if (strcmp(type, r->type()) == 0) return r;
    }
    return nullptr;
  }

  // Returns the registered object for a type. Unknown types are fatal.
  T *Lookup(const string &type) const {
    const Registrar *r = Find(type.c_str());
    if (r == nullptr) LOG(FATAL) << "Unknown " << name << ": " << type;
    return r->object();
  }

  // Kind of components held, used in error messages.
  const char *name;

  // Base class of the registered components.
  const char *class_name;

  // Most recently registered entry first.
  Registrar *components;
};

// Base class for components created per use through a factory.
template <class T> class Component {
 public:
  typedef std::function<T *()> Factory;
  typedef ComponentRegistry<Factory> Registry;

  // Returns a new instance of a registered type. The caller takes ownership.
  static T *Create(const string &type) {
    return (*registry_.Lookup(type))();
  }

  static bool IsRegistered(const string &type) {
    return registry_.Find(type.c_str()) != nullptr;
  }

  static Registry *registry() { return &registry_; }

 private:
  static Registry registry_;
};

// Base class for components registered as a single shared instance.
template <class T> class Singleton {
 public:
  typedef ComponentRegistry<T> Registry;

  static Registry *registry() { return &registry_; }

 private:
  static Registry registry_;
};

// Registries hold only constants and are initialized statically, so
// registrars in other translation units can link into them in any order.
#define REGISTER_COMPONENT_REGISTRY(type, classname)                 \
  template <> __attribute__((init_priority(900)))                    \
  classname::Registry spanlab::Component<classname>::registry_ = {   \
      type, #classname, nullptr}

#define REGISTER_COMPONENT_TYPE(base, type, component)                   \
  static base::Factory __##component##_factory = [] {                  \
    return new component;                                              \
  };                                                                   \
  __attribute__((init_priority(800)))                                  \
  static base::Registry::Registrar __##component##_registrar(          \
      base::registry(), type, #component, &__##component##_factory)

#define REGISTER_SINGLETON_REGISTRY(type, classname)                 \
  template <> __attribute__((init_priority(900)))                    \
  classname::Registry spanlab::Singleton<classname>::registry_ = {   \
      type, #classname, nullptr}

#define REGISTER_SINGLETON_TYPE(base, type, component)                 \
  __attribute__((init_priority(800)))                                  \
  static base::Registry::Registrar __##component##_registrar(          \
      base::registry(), type, #component, new component)

}  // namespace spanlab

#endif  // SPANLAB_BASE_REGISTRY_H_
