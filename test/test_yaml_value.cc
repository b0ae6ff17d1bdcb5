/** @file

    YAML conversion tests.

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

#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "swoc/Errata.h"
#include "swoc/swoc_file.h"

#include "deepeq/deep_equal.h"
#include "deepeq/heap.h"
#include "deepeq/type.h"
#include "deepeq/yaml_value.h"

using deepeq::deep_equal;
using deepeq::Heap;
using deepeq::Kind;
using deepeq::Type;
using deepeq::TypeTable;
using deepeq::Value;
using deepeq::YamlLoader;
using deepeq::YamlOptions;
using swoc::Severity;

class YamlValueTest : public ::testing::Test {
protected:
  /// Parse @a content, which must be clean.
  Value
  parse(YamlLoader &loader, std::string const &content)
  {
    auto rv = loader.parse(content);
    EXPECT_TRUE(rv.errata().is_ok());
    return rv.result();
  }

  /// Value for @a key in the map held by the variant @a v.
  Value const &
  entry(Value const &v, std::string const &key)
  {
    static Value const absent;
    auto spot = v.boxed()->map()->find(Value::string(key));
    return spot ? *spot : absent;
  }

  TypeTable types;
  Heap heap;
};

TEST_F(YamlValueTest, NodeKinds) {
  YamlLoader loader{heap, types};
  auto v = parse(loader, "list: [x, y]\nmap: {k: v}\nnothing: ~\nscalar: 12\n");
  ASSERT_EQ(v.type(), loader.any_type());
  ASSERT_NE(v.boxed(), nullptr);
  EXPECT_EQ(v.boxed()->type(), loader.dict_type());
  EXPECT_EQ(v.boxed()->size(), 4u);

  EXPECT_EQ(entry(v, "list").boxed()->type(), loader.list_type());
  EXPECT_EQ(entry(v, "list").boxed()->size(), 2u);
  EXPECT_EQ(entry(v, "map").boxed()->kind(), Kind::MAP);
  EXPECT_TRUE(entry(v, "nothing").is_null());
  EXPECT_EQ(entry(v, "scalar").boxed()->as_string(), "12");
}

TEST_F(YamlValueTest, EmptyDocumentIsAbsent) {
  YamlLoader loader{heap, types};
  auto v = parse(loader, "");
  EXPECT_EQ(v.type(), loader.any_type());
  EXPECT_TRUE(v.is_null());
}

TEST_F(YamlValueTest, TypedScalars) {
  YamlOptions opts;
  opts.typed_scalars = true;
  YamlLoader loader{heap, types, opts};
  auto v = parse(loader, "a: true\nb: 12\nc: 1.5\nd: '7'\ne: text\nf: FALSE\n");

  EXPECT_EQ(entry(v, "a").boxed()->type(), Type::boolean());
  EXPECT_TRUE(entry(v, "a").boxed()->as_bool());
  EXPECT_EQ(entry(v, "b").boxed()->as_integer(), 12);
  EXPECT_EQ(entry(v, "c").boxed()->type(), Type::floating());
  EXPECT_EQ(entry(v, "d").boxed()->as_string(), "7");
  EXPECT_EQ(entry(v, "e").boxed()->as_string(), "text");
  EXPECT_FALSE(entry(v, "f").boxed()->as_bool());
}

TEST_F(YamlValueTest, TypedScalarsOutOfRange) {
  YamlOptions opts;
  opts.typed_scalars = true;
  YamlLoader loader{heap, types, opts};
  auto v = parse(loader, "big: 99999999999999999999\nsmall: -99999999999999999999\nfits: 12\n");

  EXPECT_EQ(entry(v, "big").boxed()->type(), Type::string());
  EXPECT_EQ(entry(v, "big").boxed()->as_string(), "99999999999999999999");
  EXPECT_EQ(entry(v, "small").boxed()->type(), Type::string());
  EXPECT_EQ(entry(v, "fits").boxed()->as_integer(), 12);

  auto result = deep_equal(parse(loader, "a: 99999999999999999999\n"), parse(loader, "a: 99999999999999999998\n"));
  EXPECT_FALSE(result.equal);
  EXPECT_NE(result.trace.find("\"99999999999999999999\" != \"99999999999999999998\""), std::string::npos);
}

TEST_F(YamlValueTest, KeyOrderDoesNotMatter) {
  YamlLoader loader{heap, types};
  auto lhs    = parse(loader, "a: 1\nb: [x, y]\n");
  auto rhs    = parse(loader, "b: [x, y]\na: 1\n");
  auto result = deep_equal(lhs, rhs);
  EXPECT_TRUE(result.equal);
  EXPECT_NE(result.trace.find("Comparing maps of type: map[string]any"), std::string::npos);
}

TEST_F(YamlValueTest, SequenceOrderMatters) {
  YamlLoader loader{heap, types};
  EXPECT_FALSE(deep_equal(parse(loader, "[1, 2]"), parse(loader, "[2, 1]")).equal);
}

TEST_F(YamlValueTest, NestedDifferenceNamesKey) {
  YamlLoader loader{heap, types};
  auto result = deep_equal(parse(loader, "a: {b: 1}\n"), parse(loader, "a: {b: 2}\n"));
  EXPECT_FALSE(result.equal);
  EXPECT_NE(result.trace.find("\"b\": Comparing variants of type: any"), std::string::npos);
  EXPECT_NE(result.trace.find("\"1\" != \"2\""), std::string::npos);
}

TEST_F(YamlValueTest, TypedScalarsDistinguishRepresentations) {
  YamlLoader text{heap, types};
  EXPECT_TRUE(deep_equal(parse(text, "a: 1\n"), parse(text, "a: '1'\n")).equal);

  YamlOptions opts;
  opts.typed_scalars = true;
  YamlLoader typed{heap, types, opts};
  auto result = deep_equal(parse(typed, "a: 1\n"), parse(typed, "a: '1'\n"));
  EXPECT_FALSE(result.equal);
  EXPECT_NE(result.trace.find("Types don't match"), std::string::npos);
}

TEST_F(YamlValueTest, LoadersHaveDistinctTypes) {
  YamlLoader first{heap, types};
  YamlLoader second{heap, types};
  auto result = deep_equal(parse(first, "a: 1\n"), parse(second, "a: 1\n"));
  EXPECT_FALSE(result.equal);
  EXPECT_EQ(result.trace, "");
}

TEST_F(YamlValueTest, ParseError) {
  YamlLoader loader{heap, types};
  auto rv = loader.parse("a: [1, 2", "broken");
  EXPECT_TRUE(rv.errata().severity() >= Severity::ERROR);
  EXPECT_FALSE(rv.result().is_valid());
}

TEST_F(YamlValueTest, NonScalarKey) {
  YamlLoader loader{heap, types};
  auto rv = loader.parse("? [a, b]\n: 1\nc: 2\n");
  EXPECT_TRUE(rv.errata().severity() >= Severity::ERROR);
  ASSERT_NE(rv.result().boxed(), nullptr);
  EXPECT_EQ(rv.result().boxed()->size(), 1u);
}

TEST_F(YamlValueTest, LoadFile) {
  std::string path = ::testing::TempDir() + "deepeq_yaml_value_test.yaml";
  {
    std::ofstream out(path);
    out << "name: deepeq\ntags: [a, b]\n";
  }
  YamlLoader loader{heap, types};
  auto rv = loader.load(swoc::file::path{path});
  EXPECT_TRUE(rv.errata().is_ok());
  EXPECT_EQ(entry(rv.result(), "name").boxed()->as_string(), "deepeq");
  EXPECT_TRUE(deep_equal(rv.result(), parse(loader, "tags: [a, b]\nname: deepeq\n")).equal);
}

TEST_F(YamlValueTest, LoadMissingFile) {
  YamlLoader loader{heap, types};
  auto rv = loader.load(swoc::file::path{"/nonexistent/deepeq/missing.yaml"});
  EXPECT_TRUE(rv.errata().severity() >= Severity::ERROR);
  EXPECT_FALSE(rv.result().is_valid());
}
