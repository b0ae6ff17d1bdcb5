/** @file

    Detection of comparisons already in progress.

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

#include <functional>
#include <utility>

#include "deepeq/cycle_guard.h"

namespace deepeq
{
bool
CycleGuard::Visit::operator<(Visit const &that) const
{
  if (lhs != that.lhs) {
    return lhs < that.lhs;
  }
  if (rhs != that.rhs) {
    return rhs < that.rhs;
  }
  return std::less<Type const *>{}(type, that.type);
}

CycleGuard::Verdict
CycleGuard::check(Identity lhs, Identity rhs, Type const *type)
{
  if (rhs < lhs) {
    std::swap(lhs, rhs);
  }

  if (lhs == rhs) {
    return Verdict::IDENTICAL;
  }

  if (!_visited.insert(Visit{lhs, rhs, type}).second) {
    return Verdict::VISITED;
  }
  return Verdict::FRESH;
}

} // namespace deepeq
