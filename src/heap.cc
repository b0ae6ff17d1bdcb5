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

#include <atomic>
#include <stdexcept>

#include "swoc/bwf_base.h"

#include "deepeq/heap.h"

namespace deepeq
{
namespace
{
// Store ids are shared by all heaps so identities never collide.
std::atomic<std::uint64_t> NextStoreId{1};
} // namespace

Cell::Cell(std::uint64_t id, Type const *type, Value value) : Store(id), _type(type), _value(std::move(value))
{
  require_type(_type, _value, "Cell value");
}

Cell &
Cell::assign(Value v)
{
  require_type(_type, v, "Cell value");
  _value = std::move(v);
  return *this;
}

SliceStore::SliceStore(std::uint64_t id, Type const *elem, Value::Elements elts)
  : Store(id), _elem(elem), _elements(std::move(elts))
{
  for (auto const &elt : _elements) {
    require_type(_elem, elt, "Slice element");
  }
}

SliceStore &
SliceStore::set(std::size_t idx, Value v)
{
  if (idx >= _elements.size()) {
    std::string text;
    swoc::bwprint(text, "Slice element index {} is out of range - size is {}", idx, _elements.size());
    throw std::out_of_range(text);
  }
  require_type(_elem, v, "Slice element");
  _elements[idx] = std::move(v);
  return *this;
}

MapStore::MapStore(std::uint64_t id, Type const *type) : Store(id), _type(type) {}

Value const *
MapStore::find(Value const &key) const
{
  auto spot = _index.find(key);
  return spot == _index.end() ? nullptr : &_entries[spot->second].second;
}

bool
MapStore::insert(Value key, Value value)
{
  require_type(_type->key(), key, "Map key");
  require_type(_type->elem(), value, "Map value");
  if (auto spot = _index.find(key); spot != _index.end()) {
    _entries[spot->second].second = std::move(value);
    return false;
  }
  _entries.emplace_back(key, std::move(value));
  try {
    _index.emplace(std::move(key), _entries.size() - 1);
  } catch (std::exception &) {
    _entries.pop_back();
    throw;
  }
  return true;
}

template <typename S, typename... Args>
S *
Heap::make(Args &&... args)
{
  auto store = std::make_unique<S>(NextStoreId.fetch_add(1), std::forward<Args>(args)...);
  auto zret  = store.get();
  _stores.emplace_back(std::move(store));
  return zret;
}

Cell *
Heap::allocate(Type const *type)
{
  if (type == nullptr) {
    throw std::invalid_argument("Cells require a type");
  }
  return this->make<Cell>(type, Value::zero(type));
}

Cell *
Heap::allocate(Value value)
{
  if (!value.is_valid()) {
    throw std::invalid_argument("Cells cannot hold the invalid value");
  }
  auto type = value.type();
  return this->make<Cell>(type, std::move(value));
}

Value
Heap::new_reference(Type const *type, Value value)
{
  if (type == nullptr || type->kind() != Kind::REFERENCE) {
    throw std::invalid_argument("A reference type is required");
  }
  require_type(type->elem(), value, "Reference target");
  return Value::reference(type, this->allocate(std::move(value)));
}

Value
Heap::make_slice(Type const *type, Value::Elements elts)
{
  if (type == nullptr || type->kind() != Kind::SLICE) {
    throw std::invalid_argument("A slice type is required");
  }
  auto n     = elts.size();
  auto store = this->make<SliceStore>(type->elem(), std::move(elts));
  return {type, Value::Payload{Value::SliceRef{store, 0, n}}};
}

Value
Heap::make_map(Type const *type)
{
  if (type == nullptr || type->kind() != Kind::MAP) {
    throw std::invalid_argument("A map type is required");
  }
  auto store = this->make<MapStore>(type);
  return {type, Value::Payload{std::in_place_type<MapStore *>, store}};
}

Value
Heap::make_map(Type const *type, std::vector<MapStore::Entry> entries)
{
  auto zret = this->make_map(type);
  for (auto &&[key, value] : entries) {
    zret.map()->insert(std::move(key), std::move(value));
  }
  return zret;
}

} // namespace deepeq
