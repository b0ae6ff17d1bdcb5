/** @file

    Type descriptor tests.

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

#include <gtest/gtest.h>

#include "deepeq/type.h"

using deepeq::Kind;
using deepeq::ScalarType;
using deepeq::Type;
using deepeq::TypeTable;

class TypeTest : public ::testing::Test {
protected:
  void SetUp() override {
    node     = types.record("Node");
    node_ref = types.reference_to(node);
    node->add_field("Value", Type::integer()).add_field("Next", node_ref);
  }

  TypeTable types;
  Type *node            = nullptr;
  Type const *node_ref  = nullptr;
};

// === NAMING ===

TEST_F(TypeTest, ScalarSingletons) {
  EXPECT_EQ(Type::boolean()->name(), "bool");
  EXPECT_EQ(Type::integer()->name(), "int");
  EXPECT_EQ(Type::floating()->name(), "float");
  EXPECT_EQ(Type::string()->name(), "string");
  EXPECT_EQ(Type::integer(), Type::integer());
  EXPECT_EQ(Type::string()->kind(), Kind::SCALAR);
  EXPECT_EQ(Type::string()->scalar(), ScalarType::STRING);
}

TEST_F(TypeTest, GeneratedNames) {
  EXPECT_EQ(types.array_of(Type::integer(), 3)->name(), "[3]int");
  EXPECT_EQ(types.slice_of(Type::string())->name(), "[]string");
  EXPECT_EQ(types.map_of(Type::string(), Type::integer())->name(), "map[string]int");
  EXPECT_EQ(node_ref->name(), "*Node");
  EXPECT_EQ(types.variant()->name(), "any");
  EXPECT_EQ(types.callable()->name(), "func()");
  EXPECT_EQ(types.slice_of(types.slice_of(Type::boolean()))->name(), "[][]bool");
}

TEST_F(TypeTest, ExplicitNames) {
  auto names = types.slice_of(Type::string(), "Names");
  EXPECT_EQ(names->name(), "Names");
  EXPECT_EQ(names->kind(), Kind::SLICE);
  EXPECT_EQ(names->elem(), Type::string());
}

TEST_F(TypeTest, TypesAreNominal) {
  auto a = types.slice_of(Type::string());
  auto b = types.slice_of(Type::string());
  EXPECT_NE(a, b);
  EXPECT_EQ(a->name(), b->name());

  auto celsius = types.scalar(ScalarType::FLOAT, "Celsius");
  EXPECT_NE(celsius, Type::floating());
  EXPECT_EQ(celsius->scalar(), ScalarType::FLOAT);
}

// === RECORDS ===

TEST_F(TypeTest, RecordFields) {
  ASSERT_EQ(node->fields().size(), 2u);
  EXPECT_EQ(node->fields()[0].name, "Value");
  EXPECT_EQ(node->fields()[1].type, node_ref);
  EXPECT_EQ(node->field_index("Next"), 1u);
  EXPECT_EQ(node->field_index("Missing"), Type::npos);
}

TEST_F(TypeTest, DuplicateFieldRejected) {
  EXPECT_THROW(node->add_field("Value", Type::string()), std::invalid_argument);
  EXPECT_THROW(node->add_field("Other", nullptr), std::invalid_argument);
}

TEST_F(TypeTest, RecordsMustBeNamed) {
  EXPECT_THROW(types.record(""), std::invalid_argument);
}

// === SLOT LAYOUT ===

TEST_F(TypeTest, SlotLayout) {
  // The first field shares the slot of the record.
  EXPECT_EQ(node->slots(), 2u);
  EXPECT_EQ(node->fields()[0].offset, 0u);
  EXPECT_EQ(node->fields()[1].offset, 1u);

  auto nodes = types.array_of(node, 3);
  EXPECT_EQ(nodes->slots(), 6u);
  EXPECT_EQ(nodes->elem_offset(2), 4u);

  EXPECT_EQ(types.record("Empty")->slots(), 1u);
  EXPECT_EQ(types.array_of(Type::integer(), 0)->slots(), 1u);
}

TEST_F(TypeTest, NestedRecordOffsets) {
  auto outer = types.record("Outer");
  outer->add_field("Head", node).add_field("Tail", Type::integer());
  EXPECT_EQ(outer->fields()[1].offset, node->slots());
  EXPECT_EQ(outer->slots(), node->slots() + 1);
}

// === MAP KEYS ===

TEST_F(TypeTest, MapKeyKinds) {
  EXPECT_NO_THROW(types.map_of(Type::integer(), Type::string()));
  EXPECT_NO_THROW(types.map_of(node_ref, Type::string()));
  EXPECT_THROW(types.map_of(types.slice_of(Type::integer()), Type::string()), std::invalid_argument);
  EXPECT_THROW(types.map_of(node, Type::string()), std::invalid_argument);
}

TEST_F(TypeTest, KindNames) {
  EXPECT_EQ(deepeq::KindLexicon[Kind::RECORD], "record");
  EXPECT_EQ(deepeq::KindLexicon[Kind::CALLABLE], "callable");
  EXPECT_TRUE(deepeq::is_cycle_candidate(Kind::MAP));
  EXPECT_TRUE(deepeq::is_cycle_candidate(Kind::ARRAY));
  EXPECT_FALSE(deepeq::is_cycle_candidate(Kind::REFERENCE));
  EXPECT_FALSE(deepeq::is_cycle_candidate(Kind::VARIANT));
  EXPECT_FALSE(deepeq::is_cycle_candidate(Kind::CALLABLE));
}
