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

#include <stdexcept>

#include "swoc/bwf_base.h"

#include "deepeq/heap.h"
#include "deepeq/value.h"

using swoc::TextView;

namespace deepeq
{
namespace
{
void
require_kind(Type const *type, Kind kind, TextView what)
{
  if (type == nullptr || type->kind() != kind) {
    std::string text;
    swoc::bwprint(text, "{} requires a {} type but '{}' is not", what, KindLexicon[kind],
                  type ? TextView{type->name()} : TextView{"<invalid>"});
    throw std::invalid_argument(text);
  }
}

void
require_scalar(Type const *type, ScalarType scalar, TextView what)
{
  require_kind(type, Kind::SCALAR, what);
  if (type->scalar() != scalar) {
    std::string text;
    swoc::bwprint(text, "{} does not match the representation of scalar type '{}'", what, type->name());
    throw std::invalid_argument(text);
  }
}

[[noreturn]] void
throw_out_of_range(TextView what, std::size_t idx, std::size_t size)
{
  std::string text;
  swoc::bwprint(text, "{} index {} is out of range - size is {}", what, idx, size);
  throw std::out_of_range(text);
}

} // namespace

void
require_type(Type const *expected, Value const &v, TextView what)
{
  if (v.type() != expected) {
    std::string text;
    swoc::bwprint(text, "{} must be of type '{}' but the value is of type '{}'", what,
                  expected ? TextView{expected->name()} : TextView{"<invalid>"},
                  v.type() ? TextView{v.type()->name()} : TextView{"<invalid>"});
    throw std::invalid_argument(text);
  }
}

Value::Value(Type const *type, Payload &&payload) : _type(type), _payload(std::move(payload)) {}

Value
Value::zero(Type const *type)
{
  if (type == nullptr) {
    return {};
  }

  switch (type->kind()) {
  case Kind::INVALID:
    break;
  case Kind::SCALAR:
    switch (type->scalar()) {
    case ScalarType::BOOL:
      return {type, Payload{false}};
    case ScalarType::INTEGER:
      return {type, Payload{std::intmax_t{0}}};
    case ScalarType::FLOAT:
      return {type, Payload{0.0}};
    case ScalarType::STRING:
      return {type, Payload{std::string{}}};
    case ScalarType::NONE:
      break;
    }
    break;
  case Kind::ARRAY: {
    Elements elts;
    elts.reserve(type->length());
    for (std::size_t i = 0; i < type->length(); ++i) {
      elts.push_back(zero(type->elem()));
    }
    return {type, Payload{std::move(elts)}};
  }
  case Kind::RECORD: {
    Elements fields;
    fields.reserve(type->fields().size());
    for (auto const &f : type->fields()) {
      fields.push_back(zero(f.type));
    }
    return {type, Payload{std::move(fields)}};
  }
  case Kind::SLICE:
    return {type, Payload{SliceRef{}}};
  case Kind::MAP:
    return {type, Payload{std::in_place_type<MapStore *>, nullptr}};
  case Kind::VARIANT:
    return {type, Payload{std::shared_ptr<Value const>{}}};
  case Kind::REFERENCE:
    return {type, Payload{std::in_place_type<Cell *>, nullptr}};
  case Kind::CALLABLE:
    return {type, Payload{Callable{}}};
  }
  return {};
}

Value
Value::boolean(bool b, Type const *type)
{
  require_scalar(type, ScalarType::BOOL, "Boolean value");
  return {type, Payload{b}};
}

Value
Value::integer(std::intmax_t n, Type const *type)
{
  require_scalar(type, ScalarType::INTEGER, "Integer value");
  return {type, Payload{n}};
}

Value
Value::floating(double d, Type const *type)
{
  require_scalar(type, ScalarType::FLOAT, "Float value");
  return {type, Payload{d}};
}

Value
Value::string(std::string s, Type const *type)
{
  require_scalar(type, ScalarType::STRING, "String value");
  return {type, Payload{std::move(s)}};
}

Value
Value::array(Type const *type, Elements elts)
{
  require_kind(type, Kind::ARRAY, "Array value");
  if (elts.size() != type->length()) {
    std::string text;
    swoc::bwprint(text, "Array type '{}' requires {} elements, {} were provided", type->name(), type->length(),
                  elts.size());
    throw std::invalid_argument(text);
  }
  for (auto const &elt : elts) {
    require_type(type->elem(), elt, "Array element");
  }
  return {type, Payload{std::move(elts)}};
}

Value
Value::record(Type const *type, Elements fields)
{
  require_kind(type, Kind::RECORD, "Record value");
  auto const &decl = type->fields();
  if (fields.size() != decl.size()) {
    std::string text;
    swoc::bwprint(text, "Record type '{}' has {} fields, {} values were provided", type->name(), decl.size(),
                  fields.size());
    throw std::invalid_argument(text);
  }
  for (std::size_t i = 0; i < decl.size(); ++i) {
    require_type(decl[i].type, fields[i], decl[i].name);
  }
  return {type, Payload{std::move(fields)}};
}

Value
Value::variant(Type const *type, Value payload)
{
  require_kind(type, Kind::VARIANT, "Variant value");
  if (!payload.is_valid()) {
    return zero(type);
  }
  return {type, Payload{std::make_shared<Value const>(std::move(payload))}};
}

Value
Value::reference(Type const *type, Cell *cell)
{
  require_kind(type, Kind::REFERENCE, "Reference value");
  if (cell != nullptr && cell->type() != type->elem()) {
    std::string text;
    swoc::bwprint(text, "Reference type '{}' cannot refer to a cell of type '{}'", type->name(), cell->type()->name());
    throw std::invalid_argument(text);
  }
  return {type, Payload{std::in_place_type<Cell *>, cell}};
}

Value
Value::function(Type const *type, Callable f)
{
  require_kind(type, Kind::CALLABLE, "Callable value");
  return {type, Payload{std::move(f)}};
}

bool
Value::is_null() const
{
  switch (this->kind()) {
  case Kind::SLICE:
    return this->slice().store == nullptr;
  case Kind::MAP:
    return this->map() == nullptr;
  case Kind::VARIANT:
    return this->boxed() == nullptr;
  case Kind::REFERENCE:
    return this->cell() == nullptr;
  case Kind::CALLABLE:
    return !this->callable();
  default:
    break;
  }
  return false;
}

bool
Value::as_bool() const
{
  return std::get<bool>(_payload);
}

std::intmax_t
Value::as_integer() const
{
  return std::get<std::intmax_t>(_payload);
}

double
Value::as_float() const
{
  return std::get<double>(_payload);
}

std::string const &
Value::as_string() const
{
  return std::get<std::string>(_payload);
}

Value::Elements const &
Value::elements() const
{
  return std::get<Elements>(_payload);
}

std::size_t
Value::size() const
{
  switch (this->kind()) {
  case Kind::ARRAY:
  case Kind::RECORD:
    return this->elements().size();
  case Kind::SLICE:
    return this->slice().length;
  case Kind::MAP:
    return this->map() ? this->map()->size() : 0;
  default:
    break;
  }
  return 0;
}

Value const &
Value::at(std::size_t idx) const
{
  if (this->kind() == Kind::SLICE) {
    auto const &s = this->slice();
    if (idx >= s.length) {
      throw_out_of_range("Slice", idx, s.length);
    }
    return s.store->elements()[s.offset + idx];
  }
  auto const &elts = this->elements();
  if (idx >= elts.size()) {
    throw_out_of_range("Array", idx, elts.size());
  }
  return elts[idx];
}

Value const &
Value::field(TextView name) const
{
  require_kind(_type, Kind::RECORD, "Field access");
  auto idx = _type->field_index(name);
  if (idx == Type::npos) {
    std::string text;
    swoc::bwprint(text, "Record type '{}' has no field '{}'", _type->name(), name);
    throw std::invalid_argument(text);
  }
  auto const &elts = this->elements();
  if (idx >= elts.size()) {
    throw_out_of_range("Record", idx, elts.size());
  }
  return elts[idx];
}

Value &
Value::set(std::size_t idx, Value v)
{
  auto &elts = std::get<Elements>(_payload);
  if (idx >= elts.size()) {
    throw_out_of_range(KindLexicon[this->kind()], idx, elts.size());
  }
  if (this->kind() == Kind::RECORD) {
    auto const &f = _type->fields()[idx];
    require_type(f.type, v, f.name);
  } else {
    require_type(_type->elem(), v, "Array element");
  }
  elts[idx] = std::move(v);
  return *this;
}

Value &
Value::set(TextView name, Value v)
{
  require_kind(_type, Kind::RECORD, "Field update");
  auto idx = _type->field_index(name);
  if (idx == Type::npos) {
    std::string text;
    swoc::bwprint(text, "Record type '{}' has no field '{}'", _type->name(), name);
    throw std::invalid_argument(text);
  }
  return this->set(idx, std::move(v));
}

Value::SliceRef const &
Value::slice() const
{
  return std::get<SliceRef>(_payload);
}

Value
Value::subslice(std::size_t begin, std::size_t end) const
{
  auto const &s = this->slice();
  if (begin > end || end > s.length) {
    std::string text;
    swoc::bwprint(text, "Slice bounds [{}, {}) are out of range - length is {}", begin, end, s.length);
    throw std::out_of_range(text);
  }
  if (s.store == nullptr) {
    return *this;
  }
  return {_type, Payload{SliceRef{s.store, s.offset + begin, end - begin}}};
}

MapStore *
Value::map() const
{
  return std::get<MapStore *>(_payload);
}

Value const *
Value::boxed() const
{
  return std::get<std::shared_ptr<Value const>>(_payload).get();
}

Cell *
Value::cell() const
{
  return std::get<Cell *>(_payload);
}

Callable const &
Value::callable() const
{
  return std::get<Callable>(_payload);
}

bool
scalar_equal(Value const &lhs, Value const &rhs)
{
  if (lhs.type() != rhs.type() || lhs.kind() != Kind::SCALAR) {
    return false;
  }
  switch (lhs.type()->scalar()) {
  case ScalarType::BOOL:
    return lhs.as_bool() == rhs.as_bool();
  case ScalarType::INTEGER:
    return lhs.as_integer() == rhs.as_integer();
  case ScalarType::FLOAT:
    return lhs.as_float() == rhs.as_float();
  case ScalarType::STRING:
    return lhs.as_string() == rhs.as_string();
  case ScalarType::NONE:
    break;
  }
  return false;
}

std::size_t
KeyHash::operator()(Value const &key) const
{
  std::size_t zret = std::hash<Type const *>{}(key.type());
  std::size_t h    = 0;
  if (key.kind() == Kind::REFERENCE) {
    h = std::hash<std::uint64_t>{}(key.cell() ? key.cell()->id() : 0);
  } else if (key.kind() == Kind::SCALAR) {
    switch (key.type()->scalar()) {
    case ScalarType::BOOL:
      h = std::hash<bool>{}(key.as_bool());
      break;
    case ScalarType::INTEGER:
      h = std::hash<std::intmax_t>{}(key.as_integer());
      break;
    case ScalarType::FLOAT:
      h = std::hash<double>{}(key.as_float());
      break;
    case ScalarType::STRING:
      h = std::hash<std::string>{}(key.as_string());
      break;
    case ScalarType::NONE:
      break;
    }
  }
  return zret ^ (h + 0x9e3779b9 + (zret << 6) + (zret >> 2));
}

bool
KeyEqual::operator()(Value const &lhs, Value const &rhs) const
{
  if (lhs.type() != rhs.type()) {
    return false;
  }
  if (lhs.kind() == Kind::REFERENCE) {
    return lhs.cell() == rhs.cell();
  }
  return scalar_equal(lhs, rhs);
}

bool
View::is_null() const
{
  return this->is_valid() && _value->is_null();
}

std::size_t
View::size() const
{
  return this->is_valid() ? _value->size() : 0;
}

View
View::index(std::size_t idx) const
{
  if (this->kind() == Kind::SLICE) {
    auto const &s = _value->slice();
    if (s.store == nullptr) {
      return {};
    }
    auto elem = _value->type()->elem();
    return View{_value->at(idx), s.store->identity(elem->slots() * (s.offset + idx))};
  }
  return View{_value->at(idx), _id.at(_value->type()->elem_offset(idx))};
}

View
View::field(std::size_t idx) const
{
  auto const &f    = _value->type()->fields().at(idx);
  auto const &elts = _value->elements();
  // A record value built before a field was added does not hold that field.
  if (idx >= elts.size()) {
    return {};
  }
  return View{elts[idx], _id.at(f.offset)};
}

View
View::elem() const
{
  if (this->kind() == Kind::VARIANT) {
    auto payload = _value->boxed();
    return payload ? View{*payload} : View{};
  }
  auto cell = _value->cell();
  return cell ? View{cell->value(), cell->identity()} : View{};
}

View
View::lookup(Value const &key) const
{
  auto store = _value->map();
  if (store == nullptr) {
    return {};
  }
  auto spot = store->find(key);
  return spot ? View{*spot} : View{};
}

Identity
View::storage() const
{
  if (this->kind() == Kind::MAP) {
    auto store = _value->map();
    return store ? store->identity() : Identity{};
  }
  auto const &s = _value->slice();
  return s.store ? s.store->identity(_value->type()->elem()->slots() * s.offset) : Identity{};
}

} // namespace deepeq
