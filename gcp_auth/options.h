// Copyright 2021 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef GCP_AUTH_OPTIONS_H
#define GCP_AUTH_OPTIONS_H

#include "gcp_auth/version.h"
#include <map>
#include <memory>
#include <set>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

class Options;
namespace internal {
void CheckExpectedOptionsImpl(std::set<std::type_index> const& expected,
                              Options const& opts, char const* caller);
}  // namespace internal

/**
 * A heterogeneous map from option types to values.
 *
 * An option is a struct with a `Type` alias naming its value type, e.g.:
 *
 * @code
 * struct PoolSizeOption {
 *   using Type = std::size_t;
 * };
 * auto opts = Options{}.set<PoolSizeOption>(4);
 * @endcode
 *
 * Reading an option that is not set yields a value-initialized `Type`.
 * Copies share the stored values until one of them is modified, so passing
 * `Options` by value is cheap.
 */
class Options {
 public:
  template <typename T>
  using ValueType = typename T::Type;

  Options() = default;

  template <typename T>
  Options& set(ValueType<T> v) {
    values_[typeid(T)] = Entry::Make<ValueType<T>>(std::move(v));
    return *this;
  }

  template <typename T>
  bool has() const {
    return values_.count(typeid(T)) != 0;
  }

  template <typename T>
  void unset() {
    values_.erase(typeid(T));
  }

  /// The reference is valid until the next non-const call on `*this`.
  template <typename T>
  ValueType<T> const& get() const {
    auto const it = values_.find(typeid(T));
    if (it == values_.end()) return Default<ValueType<T>>();
    return *static_cast<ValueType<T> const*>(it->second.value.get());
  }

  /// Returns a mutable reference to the option, inserting @p value first if
  /// it is not set.
  template <typename T>
  ValueType<T>& lookup(ValueType<T> value = {}) {
    auto it = values_.find(typeid(T));
    if (it == values_.end()) {
      it = values_
               .emplace(typeid(T), Entry::Make<ValueType<T>>(std::move(value)))
               .first;
    }
    auto& entry = it->second;
    if (entry.value.use_count() > 1) entry.value = entry.copy(entry.value);
    return *static_cast<ValueType<T>*>(entry.value.get());
  }

 private:
  friend void internal::CheckExpectedOptionsImpl(
      std::set<std::type_index> const&, Options const&, char const*);

  struct Entry {
    std::shared_ptr<void> value;
    std::shared_ptr<void> (*copy)(std::shared_ptr<void> const&);

    template <typename V>
    static Entry Make(V v) {
      return Entry{std::make_shared<V>(std::move(v)), &Copy<V>};
    }

    template <typename V>
    static std::shared_ptr<void> Copy(std::shared_ptr<void> const& p) {
      return std::make_shared<V>(*static_cast<V const*>(p.get()));
    }
  };

  template <typename V>
  static V const& Default() {
    static auto const* const kValue = new V{};
    return *kValue;
  }

  std::map<std::type_index, Entry> values_;
};

namespace internal {

/// Logs a warning for every option in @p opts not listed in `Expected...`.
template <typename... Expected>
void CheckExpectedOptions(Options const& opts, char const* caller) {
  CheckExpectedOptionsImpl({typeid(Expected)...}, opts, caller);
}

}  // namespace internal

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_OPTIONS_H
