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

#include <algorithm>
#include <stdexcept>
#include <string_view>

#include "swoc/bwf_base.h"

#include "deepeq/type.h"

using swoc::TextView;

namespace deepeq
{
swoc::Lexicon<Kind> KindLexicon{{
  {Kind::INVALID, "invalid"},
  {Kind::ARRAY, "array"},
  {Kind::SLICE, "slice"},
  {Kind::MAP, "map"},
  {Kind::RECORD, "record"},
  {Kind::VARIANT, "variant"},
  {Kind::REFERENCE, "reference"},
  {Kind::CALLABLE, "callable"},
  {Kind::SCALAR, "scalar"},
}};

bool
is_cycle_candidate(Kind kind)
{
  switch (kind) {
  case Kind::ARRAY:
  case Kind::SLICE:
  case Kind::MAP:
  case Kind::RECORD:
    return true;
  default:
    break;
  }
  return false;
}

Type::Type(Kind kind, std::string name) : _kind(kind), _name(std::move(name)) {}

Type::Type(ScalarType scalar, std::string name) : _kind(Kind::SCALAR), _scalar(scalar), _name(std::move(name)) {}

std::size_t
Type::field_index(TextView name) const
{
  auto spot = std::find_if(_fields.begin(), _fields.end(),
                           [=](Field const &f) -> bool { return std::string_view(name) == std::string_view(f.name); });
  return spot == _fields.end() ? npos : spot - _fields.begin();
}

Type &
Type::add_field(std::string name, Type const *type)
{
  if (_kind != Kind::RECORD) {
    throw std::invalid_argument("Fields can only be added to a record type");
  }
  if (type == nullptr) {
    throw std::invalid_argument("Field type must not be null");
  }
  if (this->field_index(name) != npos) {
    std::string text;
    swoc::bwprint(text, "Field '{}' is already defined in record '{}'", name, _name);
    throw std::invalid_argument(text);
  }
  // An empty record still takes a slot, which the first field then shares.
  std::size_t offset = _fields.empty() ? 0 : _slots;
  _fields.push_back(Field{std::move(name), type, offset});
  _slots = offset + type->slots();
  return *this;
}

std::size_t
Type::elem_offset(std::size_t idx) const
{
  return _elem ? idx * _elem->slots() : idx;
}

Type const *
Type::boolean()
{
  static Type const t{ScalarType::BOOL, "bool"};
  return &t;
}

Type const *
Type::integer()
{
  static Type const t{ScalarType::INTEGER, "int"};
  return &t;
}

Type const *
Type::floating()
{
  static Type const t{ScalarType::FLOAT, "float"};
  return &t;
}

Type const *
Type::string()
{
  static Type const t{ScalarType::STRING, "string"};
  return &t;
}

Type *
TypeTable::make(Kind kind, std::string name)
{
  _types.emplace_back(new Type(kind, std::move(name)));
  return _types.back().get();
}

Type const *
TypeTable::array_of(Type const *elem, std::size_t n, std::string name)
{
  if (elem == nullptr) {
    throw std::invalid_argument("Array element type must not be null");
  }
  if (name.empty()) {
    swoc::bwprint(name, "[{}]{}", n, elem->name());
  }
  auto t     = this->make(Kind::ARRAY, std::move(name));
  t->_elem   = elem;
  t->_length = n;
  t->_slots  = std::max<std::size_t>(1, n * elem->slots());
  return t;
}

Type const *
TypeTable::slice_of(Type const *elem, std::string name)
{
  if (elem == nullptr) {
    throw std::invalid_argument("Slice element type must not be null");
  }
  if (name.empty()) {
    swoc::bwprint(name, "[]{}", elem->name());
  }
  auto t   = this->make(Kind::SLICE, std::move(name));
  t->_elem = elem;
  return t;
}

Type const *
TypeTable::map_of(Type const *key, Type const *value, std::string name)
{
  if (key == nullptr || value == nullptr) {
    throw std::invalid_argument("Map key and value types must not be null");
  }
  if (key->kind() != Kind::SCALAR && key->kind() != Kind::REFERENCE) {
    std::string text;
    swoc::bwprint(text, "Map key type '{}' is a {} - it must be a scalar or a reference", key->name(),
                  KindLexicon[key->kind()]);
    throw std::invalid_argument(text);
  }
  if (name.empty()) {
    swoc::bwprint(name, "map[{}]{}", key->name(), value->name());
  }
  auto t   = this->make(Kind::MAP, std::move(name));
  t->_key  = key;
  t->_elem = value;
  return t;
}

Type const *
TypeTable::reference_to(Type const *elem, std::string name)
{
  if (elem == nullptr) {
    throw std::invalid_argument("Reference target type must not be null");
  }
  if (name.empty()) {
    swoc::bwprint(name, "*{}", elem->name());
  }
  auto t   = this->make(Kind::REFERENCE, std::move(name));
  t->_elem = elem;
  return t;
}

Type const *
TypeTable::variant(std::string name)
{
  return this->make(Kind::VARIANT, std::move(name));
}

Type const *
TypeTable::callable(std::string name)
{
  return this->make(Kind::CALLABLE, std::move(name));
}

Type const *
TypeTable::scalar(ScalarType scalar, std::string name)
{
  if (scalar == ScalarType::NONE || name.empty()) {
    throw std::invalid_argument("Scalar types must have a representation and a name");
  }
  auto t     = this->make(Kind::SCALAR, std::move(name));
  t->_scalar = scalar;
  return t;
}

Type *
TypeTable::record(std::string name)
{
  if (name.empty()) {
    throw std::invalid_argument("Record types must be named");
  }
  return this->make(Kind::RECORD, std::move(name));
}

} // namespace deepeq
