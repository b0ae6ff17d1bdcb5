/** @file

    Heap storage for values that can be referenced and shared.

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
#include <deque>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

#include "deepeq/value.h"

namespace deepeq
{
/// Base of all heap storage. The id is assigned by the owning heap and is unique across all heaps.
class Store
{
public:
  explicit Store(std::uint64_t id);
  virtual ~Store() = default;

  std::uint64_t id() const;
  /// Identity of the slot @a offset in this store.
  Identity identity(std::size_t offset = 0) const;

protected:
  std::uint64_t _id;
};

/// Target of a reference, holds a single value.
class Cell : public Store
{
public:
  Cell(std::uint64_t id, Type const *type, Value value);

  Type const *type() const;
  Value const &value() const;
  /// Mutable access, for updating fields and elements in place.
  Value &value();
  /// Replace the value, which must be of the cell type.
  Cell &assign(Value v);

protected:
  Type const *_type;
  Value _value;
};

/// Backing store of slices.
class SliceStore : public Store
{
public:
  SliceStore(std::uint64_t id, Type const *elem, Value::Elements elts);

  Type const *elem() const;
  Value::Elements const &elements() const;
  /// Update element @a idx - this is visible through every slice sharing the store.
  SliceStore &set(std::size_t idx, Value v);

protected:
  Type const *_elem;
  Value::Elements _elements;
};

/// Storage of a map. Entries are kept in insertion order and looked up by native key equality.
class MapStore : public Store
{
public:
  using Entry = std::pair<Value, Value>;

  MapStore(std::uint64_t id, Type const *type);

  std::size_t size() const;
  std::vector<Entry> const &entries() const;

  /// Value for @a key, @c nullptr if not present.
  Value const *find(Value const &key) const;

  /** Insert or replace an entry.
   *
   * @return @c true if a new entry was added, @c false if an existing value was replaced.
   */
  bool insert(Value key, Value value);

protected:
  Type const *_type;
  std::vector<Entry> _entries;
  std::unordered_map<Value, std::size_t, KeyHash, KeyEqual> _index;
};

/** Owner of heap storage.
 *
 * Every store gets the next id from a process wide sequence starting at 1, which is the origin of
 * the identities of the values inside it. Values from different heaps therefore never share an
 * identity. Nothing is released before the heap itself so cyclic graphs are safe.
 */
class Heap
{
public:
  Heap()             = default;
  Heap(Heap const &) = delete;
  Heap &operator=(Heap const &) = delete;

  /// Cell holding the zero value of @a type.
  Cell *allocate(Type const *type);
  /// Cell holding @a value.
  Cell *allocate(Value value);
  /// Allocate a cell for @a value and return a reference of @a type to it.
  Value new_reference(Type const *type, Value value);

  /// Non-null slice of @a type over a new store holding @a elts.
  Value make_slice(Type const *type, Value::Elements elts);
  /// Non-null, empty map of @a type.
  Value make_map(Type const *type);
  /// Non-null map of @a type holding @a entries, inserted in order.
  Value make_map(Type const *type, std::vector<MapStore::Entry> entries);

  std::size_t count() const;

protected:
  template <typename S, typename... Args> S *make(Args &&... args);

  std::deque<std::unique_ptr<Store>> _stores;
};

// --- Implementation

inline Store::Store(std::uint64_t id) : _id(id) {}

inline std::uint64_t
Store::id() const
{
  return _id;
}

inline Identity
Store::identity(std::size_t offset) const
{
  return Identity{_id, offset};
}

inline Type const *
Cell::type() const
{
  return _type;
}

inline Value const &
Cell::value() const
{
  return _value;
}

inline Value &
Cell::value()
{
  return _value;
}

inline Type const *
SliceStore::elem() const
{
  return _elem;
}

inline Value::Elements const &
SliceStore::elements() const
{
  return _elements;
}

inline std::size_t
MapStore::size() const
{
  return _entries.size();
}

inline std::vector<MapStore::Entry> const &
MapStore::entries() const
{
  return _entries;
}

inline std::size_t
Heap::count() const
{
  return _stores.size();
}

} // namespace deepeq
