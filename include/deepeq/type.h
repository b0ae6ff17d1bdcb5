/** @file

    Type descriptors for the value model.

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

#include <cstddef>
#include <deque>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "swoc/Lexicon.h"
#include "swoc/TextView.h"

namespace deepeq
{
/// Kinds of values. This is a closed set and the comparator handles every member.
enum class Kind {
  INVALID,   ///< No value (untyped absent, missing map entry, target of a null reference).
  ARRAY,     ///< Fixed length sequence.
  SLICE,     ///< Variable length sequence, possibly null.
  MAP,       ///< Associative collection, possibly null.
  RECORD,    ///< Named fields in declared order.
  VARIANT,   ///< Dynamically typed wrapper, possibly absent.
  REFERENCE, ///< Reference to a heap cell, possibly null.
  CALLABLE,  ///< Function object, only nullness is observable.
  SCALAR     ///< Everything else - compared by value.
};

/// Representation of a scalar payload.
enum class ScalarType { NONE, BOOL, INTEGER, FLOAT, STRING };

/// Conversion between kinds and their names.
extern swoc::Lexicon<Kind> KindLexicon;

/** Check if values of @a kind take part in cycle detection.
 *
 * These are the aggregate kinds whose storage can be reached more than once in a cyclic graph.
 */
bool is_cycle_candidate(Kind kind);

class Type;

/// Record field descriptor.
struct Field {
  std::string name;  ///< Field name, used as the trace label.
  Type const *type;  ///< Field type.
  std::size_t offset; ///< Slot offset of the field inside the record.
};

/** Descriptor of a static type.
 *
 * Types are nominal - two values have the same type only if they refer to the same descriptor.
 * Scalar descriptors are process wide singletons, all other descriptors are owned by a
 * @c TypeTable.
 */
class Type
{
  friend class TypeTable;

public:
  static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

  Kind kind() const;
  ScalarType scalar() const;
  std::string const &name() const;

  /// Element type of an array, slice, or reference, value type of a map.
  Type const *elem() const;
  /// Key type of a map.
  Type const *key() const;
  /// Number of elements of an array.
  std::size_t length() const;

  /// Fields of a record in declared order.
  std::vector<Field> const &fields() const;
  /// Index of the field @a name, @c npos if there is no such field.
  std::size_t field_index(swoc::TextView name) const;

  /** Append a field to a record.
   *
   * @param name Field name, must be unique in the record.
   * @param type Field type.
   * @return @a this
   *
   * Fields must be added before the record is used as the element of an array or the field of
   * another record, since those compute their storage layout from it. Record values created
   * before a field is added do not hold it - @c View::field reports it as invalid and
   * @c Value::field throws @c std::out_of_range.
   */
  Type &add_field(std::string name, Type const *type);

  /// Number of identity slots occupied by a value of this type.
  std::size_t slots() const;
  /// Slot offset of element @a idx of an array.
  std::size_t elem_offset(std::size_t idx) const;

  // Scalar singletons.
  static Type const *boolean();
  static Type const *integer();
  static Type const *floating();
  static Type const *string();

protected:
  Type(Kind kind, std::string name);
  Type(ScalarType scalar, std::string name);

  Kind _kind;
  ScalarType _scalar{ScalarType::NONE};
  std::string _name;
  Type const *_elem{nullptr};
  Type const *_key{nullptr};
  std::size_t _length{0};
  std::vector<Field> _fields;
  std::size_t _slots{1};
};

/** Owner of composite type descriptors.
 *
 * Descriptors live as long as the table. If @a name is empty the conventional name is generated
 * from the component types.
 */
class TypeTable
{
public:
  TypeTable()                  = default;
  TypeTable(TypeTable const &) = delete;
  TypeTable &operator=(TypeTable const &) = delete;

  Type const *array_of(Type const *elem, std::size_t n, std::string name = {});
  Type const *slice_of(Type const *elem, std::string name = {});
  /// Map descriptor. @a key must be a scalar or reference type.
  Type const *map_of(Type const *key, Type const *value, std::string name = {});
  Type const *reference_to(Type const *elem, std::string name = {});
  Type const *variant(std::string name = "any");
  Type const *callable(std::string name = "func()");
  /// Named scalar type, distinct from the singleton with the same representation.
  Type const *scalar(ScalarType scalar, std::string name);
  /// Empty record, fields are added with @c Type::add_field.
  Type *record(std::string name);

  std::size_t count() const;

protected:
  Type *make(Kind kind, std::string name);

  std::deque<std::unique_ptr<Type>> _types;
};

// --- Implementation

inline Kind
Type::kind() const
{
  return _kind;
}

inline ScalarType
Type::scalar() const
{
  return _scalar;
}

inline std::string const &
Type::name() const
{
  return _name;
}

inline Type const *
Type::elem() const
{
  return _elem;
}

inline Type const *
Type::key() const
{
  return _key;
}

inline std::size_t
Type::length() const
{
  return _length;
}

inline std::vector<Field> const &
Type::fields() const
{
  return _fields;
}

inline std::size_t
Type::slots() const
{
  return _slots;
}

inline std::size_t
TypeTable::count() const
{
  return _types.size();
}

} // namespace deepeq
