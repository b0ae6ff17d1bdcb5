/** @file

    Deep equality with a diagnostic trace.

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

#include "deepeq/deep_equal.h"
#include "deepeq/heap.h"
#include "deepeq/render.h"

namespace deepeq
{
Result
deep_equal(Value const &lhs, Value const &rhs)
{
  if (!lhs.is_valid() || !rhs.is_valid()) {
    return {lhs.is_valid() == rhs.is_valid(), {}};
  }
  if (lhs.type() != rhs.type()) {
    return {false, {}};
  }

  Comparison cmp;
  bool equal_p = cmp.equal(View{lhs}, View{rhs});
  return {equal_p, cmp.release_trace()};
}

bool
Comparison::equal(View const &lhs, View const &rhs)
{
  TraceWriter::DepthScope scope{_trace};

  if (!lhs.is_valid() || !rhs.is_valid()) {
    _trace.line("Something is not valid: {} {}", lhs, rhs);
    return lhs.is_valid() == rhs.is_valid();
  }
  if (lhs.type() != rhs.type()) {
    _trace.line("Types don't match");
    return false;
  }

  auto kind = lhs.kind();
  if (is_cycle_candidate(kind) && lhs.is_addressable() && rhs.is_addressable()) {
    switch (_guard.check(lhs.identity(), rhs.identity(), lhs.type())) {
    case CycleGuard::Verdict::IDENTICAL:
      _trace.line("  Same address, so equal");
      return true;
    case CycleGuard::Verdict::VISITED:
      _trace.line("  Already visited, so equal");
      return true;
    case CycleGuard::Verdict::FRESH:
      break;
    }
  }

  switch (kind) {
  case Kind::INVALID: // already handled by the validity check.
    break;
  case Kind::ARRAY:
    return this->equal_array(lhs, rhs);
  case Kind::SLICE:
    return this->equal_slice(lhs, rhs);
  case Kind::VARIANT:
    return this->equal_variant(lhs, rhs);
  case Kind::REFERENCE:
    return this->equal_reference(lhs, rhs);
  case Kind::RECORD:
    return this->equal_record(lhs, rhs);
  case Kind::MAP:
    return this->equal_map(lhs, rhs);
  case Kind::CALLABLE:
    return this->equal_callable(lhs, rhs);
  case Kind::SCALAR:
    return this->equal_scalar(lhs, rhs);
  }
  return false;
}

bool
Comparison::equal_array(View const &lhs, View const &rhs)
{
  _trace.line("Comparing arrays of type: {}", *lhs.type());
  // Same type, therefore same length.
  for (std::size_t i = 0, n = lhs.size(); i < n; ++i) {
    if (!this->equal(lhs.index(i), rhs.index(i))) {
      return false;
    }
  }
  return true;
}

bool
Comparison::equal_slice(View const &lhs, View const &rhs)
{
  _trace.line("Comparing slices of type: {}", *lhs.type());
  if (lhs.is_null() != rhs.is_null()) {
    _trace.line("  {} != {}", lhs, rhs);
    _trace.line("  One of the slices is null, so not equal");
    return false;
  }
  if (lhs.size() != rhs.size()) {
    _trace.line("  Unequal lengths, so not equal");
    return false;
  }
  if (lhs.storage() == rhs.storage()) {
    _trace.line("  Same storage, so equal");
    return true;
  }
  for (std::size_t i = 0, n = lhs.size(); i < n; ++i) {
    if (!this->equal(lhs.index(i), rhs.index(i))) {
      return false;
    }
  }
  return true;
}

bool
Comparison::equal_variant(View const &lhs, View const &rhs)
{
  _trace.line("Comparing variants of type: {}", *lhs.type());
  if (lhs.is_null() && rhs.is_null()) {
    _trace.line("  Both variants are absent, so equal");
    return true;
  }
  if (lhs.is_null() || rhs.is_null()) {
    _trace.line("  One of the variants is absent, so not equal");
    return false;
  }
  return this->equal(lhs.elem(), rhs.elem());
}

bool
Comparison::equal_reference(View const &lhs, View const &rhs)
{
  _trace.line("Comparing references of type: {}", *lhs.type());
  // A null reference has an invalid target, which the next level reports.
  return this->equal(lhs.elem(), rhs.elem());
}

bool
Comparison::equal_record(View const &lhs, View const &rhs)
{
  _trace.line("Comparing records of type: {}", *lhs.type());
  auto const &fields = lhs.type()->fields();
  for (std::size_t i = 0, n = fields.size(); i < n; ++i) {
    _trace.label("  {}: ", fields[i].name);
    if (!this->equal(lhs.field(i), rhs.field(i))) {
      return false;
    }
  }
  return true;
}

bool
Comparison::equal_map(View const &lhs, View const &rhs)
{
  _trace.line("Comparing maps of type: {}", *lhs.type());
  if (lhs.is_null() != rhs.is_null()) {
    _trace.line("  One of the maps is null, so not equal");
    return false;
  }
  if (lhs.size() != rhs.size()) {
    _trace.line("  Lengths don't match, so not equal");
    return false;
  }
  if (lhs.storage() == rhs.storage()) {
    _trace.line("  Same storage, so equal");
    return true;
  }
  for (auto const &[key, value] : lhs.value().map()->entries()) {
    _trace.label("{}: ", key);
    if (!this->equal(View{value}, rhs.lookup(key))) {
      return false;
    }
  }
  return true;
}

bool
Comparison::equal_callable(View const &lhs, View const &rhs)
{
  if (lhs.is_null() && rhs.is_null()) {
    _trace.line("  Both null callables, so equal");
    return true;
  }
  // Targets can't be compared.
  _trace.line("  Not both null callables, so not equal");
  return false;
}

bool
Comparison::equal_scalar(View const &lhs, View const &rhs)
{
  if (scalar_equal(lhs.value(), rhs.value())) {
    _trace.line("{} == {}", lhs, rhs);
    return true;
  }
  _trace.line("{} != {}", lhs, rhs);
  return false;
}

} // namespace deepeq
