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

#pragma once

#include <set>

#include "deepeq/type.h"
#include "deepeq/value.h"

namespace deepeq
{
/** Record of the pairs of storage locations being compared.
 *
 * A pair that is encountered again while its comparison is in progress is assumed to be equal. This
 * is what makes the comparison of cyclic structures terminate.
 */
class CycleGuard
{
public:
  enum class Verdict {
    IDENTICAL, ///< Both sides are the same location.
    VISITED,   ///< The pair has been seen before.
    FRESH      ///< First encounter, the pair is now recorded.
  };

  /// Check the pair ( @a lhs, @a rhs ) for values of @a type, recording it if not already present.
  Verdict check(Identity lhs, Identity rhs, Type const *type);

  /// Number of recorded pairs.
  std::size_t count() const;

protected:
  /// Visit record. The identities are in canonical order, smaller first.
  struct Visit {
    Identity lhs;
    Identity rhs;
    Type const *type;

    bool operator<(Visit const &that) const;
  };

  std::set<Visit> _visited;
};

inline std::size_t
CycleGuard::count() const
{
  return _visited.size();
}

} // namespace deepeq
