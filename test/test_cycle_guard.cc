/** @file

    Cycle guard tests.

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

#include <gtest/gtest.h>

#include "deepeq/cycle_guard.h"
#include "deepeq/type.h"

using deepeq::CycleGuard;
using deepeq::Identity;
using deepeq::Type;
using deepeq::TypeTable;

class CycleGuardTest : public ::testing::Test {
protected:
  TypeTable types;
  CycleGuard guard;
  Identity a{1, 0};
  Identity b{2, 0};
  Identity c{2, 1};
};

TEST_F(CycleGuardTest, FirstVisitIsFresh) {
  EXPECT_EQ(guard.check(a, b, Type::integer()), CycleGuard::Verdict::FRESH);
  EXPECT_EQ(guard.count(), 1u);
}

TEST_F(CycleGuardTest, RevisitIsVisited) {
  guard.check(a, b, Type::integer());
  EXPECT_EQ(guard.check(a, b, Type::integer()), CycleGuard::Verdict::VISITED);
  EXPECT_EQ(guard.count(), 1u);
}

TEST_F(CycleGuardTest, PairsAreUnordered) {
  guard.check(b, a, Type::integer());
  EXPECT_EQ(guard.check(a, b, Type::integer()), CycleGuard::Verdict::VISITED);
}

TEST_F(CycleGuardTest, SameLocationIsIdentical) {
  EXPECT_EQ(guard.check(c, c, Type::string()), CycleGuard::Verdict::IDENTICAL);
  EXPECT_EQ(guard.count(), 0u);
}

TEST_F(CycleGuardTest, TypeDistinguishesVisits) {
  // A record and its first field share a location.
  auto rec = types.record("Pair");
  rec->add_field("First", Type::integer()).add_field("Second", Type::integer());
  EXPECT_EQ(guard.check(a, b, rec), CycleGuard::Verdict::FRESH);
  EXPECT_EQ(guard.check(a, b, Type::integer()), CycleGuard::Verdict::FRESH);
  EXPECT_EQ(guard.check(a, b, rec), CycleGuard::Verdict::VISITED);
  EXPECT_EQ(guard.count(), 2u);
}

TEST_F(CycleGuardTest, OffsetsDistinguishLocations) {
  EXPECT_EQ(guard.check(a, b, Type::integer()), CycleGuard::Verdict::FRESH);
  EXPECT_EQ(guard.check(a, c, Type::integer()), CycleGuard::Verdict::FRESH);
  EXPECT_EQ(guard.check(b, c, Type::integer()), CycleGuard::Verdict::FRESH);
  EXPECT_EQ(guard.count(), 3u);
}
