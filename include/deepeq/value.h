/** @file

    Values and the introspection view used by the comparator.

    @section license License

    Licensed to the Apache Software Foundation (ASF) under one or more contributor license
    agreements.  See the NOTICE file distributed with this work for additional information regarding
    copyright ownership.  The ASF licenses this file to you under the Apache License, Version 2.0
    (the "License"); you may not use this file except in compliance with the License.  You may
    obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

    Unless required by applicable law or agreed to in writing, software distributed under the
    License is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either
    express or implied. See the License for the specific language governing permissions and
    limitations under the License.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "swoc/TextView.h"

#include "deepeq/type.h"

namespace deepeq
{
class Cell;
class SliceStore;
class MapStore;

/** Identity of a storage location.
 *
 * @a origin is the sequence id of the heap store holding the value, @a offset is the slot of the
 * value inside that store. Values that are not reached through a store have no identity.
 */
struct Identity {
  std::uint64_t origin{0};
  std::size_t offset{0};

  bool is_addressable() const;
  /// Identity of the location @a delta slots further into the same store.
  Identity at(std::size_t delta) const;
};

bool operator==(Identity const &lhs, Identity const &rhs);
bool operator!=(Identity const &lhs, Identity const &rhs);
bool operator<(Identity const &lhs, Identity const &rhs);

/// Function payload. Only the presence of a target is observable.
using Callable = std::function<void()>;

/** A typed value.
 *
 * A default constructed value has no type and is the untyped absent value. Arrays and records hold
 * their elements inline and copy them, slices and maps refer to heap storage and share it, as do
 * references.
 */
class Value
{
public:
  using self_type = Value;
  using Elements  = std::vector<Value>;

  /// Slice payload - a window on a backing store.
  struct SliceRef {
    SliceStore *store{nullptr}; ///< Backing store, @c nullptr for a null slice.
    std::size_t offset{0};      ///< Index of the first element in the store.
    std::size_t length{0};      ///< Number of elements.
  };

  using Payload = std::variant<std::monostate, bool, std::intmax_t, double, std::string, Elements, SliceRef, MapStore *,
                               std::shared_ptr<Value const>, Cell *, Callable>;

  Value() = default;

  /// The zero value of @a type.
  static Value zero(Type const *type);

  static Value boolean(bool b, Type const *type = Type::boolean());
  static Value integer(std::intmax_t n, Type const *type = Type::integer());
  static Value floating(double d, Type const *type = Type::floating());
  static Value string(std::string s, Type const *type = Type::string());
  /// Array of @a type, there must be exactly the declared number of elements.
  static Value array(Type const *type, Elements elts);
  /// Record of @a type, with one value per field in declared order.
  static Value record(Type const *type, Elements fields);
  /// Variant of @a type wrapping @a payload. An invalid @a payload makes an absent variant.
  static Value variant(Type const *type, Value payload);
  /// Reference of @a type to @a cell, which may be @c nullptr.
  static Value reference(Type const *type, Cell *cell);
  static Value function(Type const *type, Callable f);

  bool is_valid() const;
  Type const *type() const;
  /// Kind of the value, @c Kind::INVALID if there is no type.
  Kind kind() const;

  /// Check for a null slice, map, reference, or callable, or an absent variant payload.
  bool is_null() const;

  bool as_bool() const;
  std::intmax_t as_integer() const;
  double as_float() const;
  std::string const &as_string() const;

  /// Elements of an array or fields of a record.
  Elements const &elements() const;
  /// Number of elements of an array, slice or map, number of fields of a record.
  std::size_t size() const;
  /// Element @a idx of an array or slice.
  Value const &at(std::size_t idx) const;
  /// Field @a name of a record.
  Value const &field(swoc::TextView name) const;

  /** Update an element of an array or a field of a record.
   *
   * @return @a this
   *
   * The type of @a v must be the element or field type.
   */
  self_type &set(std::size_t idx, Value v);
  self_type &set(swoc::TextView name, Value v);

  SliceRef const &slice() const;
  /// Slice of the elements [ @a begin, @a end ) of this slice sharing the same store.
  Value subslice(std::size_t begin, std::size_t end) const;

  MapStore *map() const;
  /// Payload of a variant, @c nullptr if absent.
  Value const *boxed() const;
  /// Target of a reference, @c nullptr if null.
  Cell *cell() const;
  Callable const &callable() const;

  Payload const &payload() const;

protected:
  friend class Heap;

  Value(Type const *type, Payload &&payload);

  Type const *_type{nullptr};
  Payload _payload;
};

/// Check that @a v has type @a expected, throw @c std::invalid_argument if not.
void require_type(Type const *expected, Value const &v, swoc::TextView what);

/// Compare the payloads of two scalars by value.
bool scalar_equal(Value const &lhs, Value const &rhs);

/// Hash consistent with the native key equality used by maps.
struct KeyHash {
  std::size_t operator()(Value const &key) const;
};

/// Native key equality - scalars by value, references by target.
struct KeyEqual {
  bool operator()(Value const &lhs, Value const &rhs) const;
};

/** Read only view of a value together with its storage identity.
 *
 * This is the introspection interface of the comparator. A default constructed view is invalid,
 * which is also the result of looking through a null reference or looking up a missing map key.
 */
class View
{
public:
  View() = default;
  explicit View(Value const &value, Identity id = {});

  bool is_valid() const;
  Value const &value() const;
  Type const *type() const;
  Kind kind() const;

  Identity identity() const;
  bool is_addressable() const;
  bool is_null() const;
  std::size_t size() const;

  /// Element @a idx of an array or slice.
  View index(std::size_t idx) const;
  /// Field @a idx of a record, invalid if the value was built before the field was added.
  View field(std::size_t idx) const;
  /// Payload of a variant or target of a reference, invalid if absent.
  View elem() const;
  /// Value in a map for @a key, invalid if there is no such key.
  View lookup(Value const &key) const;
  /// Identity of the storage of a slice or map.
  Identity storage() const;

protected:
  Value const *_value{nullptr};
  Identity _id;
};

// --- Implementation

inline bool
Identity::is_addressable() const
{
  return origin != 0;
}

inline Identity
Identity::at(std::size_t delta) const
{
  return this->is_addressable() ? Identity{origin, offset + delta} : Identity{};
}

inline bool
operator==(Identity const &lhs, Identity const &rhs)
{
  return lhs.origin == rhs.origin && lhs.offset == rhs.offset;
}

inline bool
operator!=(Identity const &lhs, Identity const &rhs)
{
  return !(lhs == rhs);
}

inline bool
operator<(Identity const &lhs, Identity const &rhs)
{
  return lhs.origin < rhs.origin || (lhs.origin == rhs.origin && lhs.offset < rhs.offset);
}

inline bool
Value::is_valid() const
{
  return _type != nullptr;
}

inline Type const *
Value::type() const
{
  return _type;
}

inline Kind
Value::kind() const
{
  return _type ? _type->kind() : Kind::INVALID;
}

inline Value::Payload const &
Value::payload() const
{
  return _payload;
}

inline View::View(Value const &value, Identity id) : _value(&value), _id(id) {}

inline bool
View::is_valid() const
{
  return _value != nullptr && _value->is_valid();
}

inline Value const &
View::value() const
{
  return *_value;
}

inline Type const *
View::type() const
{
  return _value ? _value->type() : nullptr;
}

inline Kind
View::kind() const
{
  return _value ? _value->kind() : Kind::INVALID;
}

inline Identity
View::identity() const
{
  return _id;
}

inline bool
View::is_addressable() const
{
  return _id.is_addressable();
}

} // namespace deepeq
