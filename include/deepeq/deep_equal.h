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

#pragma once

#include <string>

#include "deepeq/cycle_guard.h"
#include "deepeq/trace_writer.h"
#include "deepeq/value.h"

namespace deepeq
{
/// Verdict and trace of a comparison.
struct Result {
  bool equal{false};
  std::string trace;
};

/** Test two values for deep equality.
 *
 * Arrays, slices, maps, record fields and variant payloads are compared element by element and
 * references are followed. Map keys are matched with native key equality, map values with deep
 * equality. A null slice is not equal to an empty slice, a null map is not equal to an empty map,
 * and callables are equal only if both are null. Cyclic structures are handled by assuming pairs
 * already under comparison are equal.
 *
 * If either value is the untyped absent value the result is whether both are, with an empty trace.
 * If the types differ the result is not equal, with an empty trace. Otherwise the trace is the
 * indented log of every comparison decision.
 */
Result deep_equal(Value const &lhs, Value const &rhs);

/** State of a single top level comparison.
 *
 * This is not thread safe - concurrent comparisons must each use their own instance.
 */
class Comparison
{
public:
  /// Compare @a lhs and @a rhs, writing the decisions to the trace.
  bool equal(View const &lhs, View const &rhs);

  TraceWriter const &trace() const;
  CycleGuard const &guard() const;
  /// Move the trace text out.
  std::string release_trace();

protected:
  bool equal_array(View const &lhs, View const &rhs);
  bool equal_slice(View const &lhs, View const &rhs);
  bool equal_variant(View const &lhs, View const &rhs);
  bool equal_reference(View const &lhs, View const &rhs);
  bool equal_record(View const &lhs, View const &rhs);
  bool equal_map(View const &lhs, View const &rhs);
  bool equal_callable(View const &lhs, View const &rhs);
  bool equal_scalar(View const &lhs, View const &rhs);

  CycleGuard _guard;
  TraceWriter _trace;
};

inline TraceWriter const &
Comparison::trace() const
{
  return _trace;
}

inline CycleGuard const &
Comparison::guard() const
{
  return _guard;
}

inline std::string
Comparison::release_trace()
{
  return _trace.release();
}

} // namespace deepeq
