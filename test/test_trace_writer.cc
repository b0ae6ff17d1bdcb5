/** @file

    Trace writer tests.

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

#include "deepeq/trace_writer.h"

using deepeq::TraceWriter;

class TraceWriterTest : public ::testing::Test {
protected:
  TraceWriter w;
};

TEST_F(TraceWriterTest, TopLevelIsNotIndented) {
  EXPECT_EQ(w.depth(), -1);
  {
    TraceWriter::DepthScope scope{w};
    EXPECT_EQ(w.depth(), 0);
    w.line("top {}", 1);
  }
  EXPECT_EQ(w.depth(), -1);
  EXPECT_EQ(w.text(), "top 1\n");
}

TEST_F(TraceWriterTest, NestedLinesAreIndented) {
  TraceWriter::DepthScope s0{w};
  w.line("zero");
  {
    TraceWriter::DepthScope s1{w};
    w.line("one");
    {
      TraceWriter::DepthScope s2{w};
      w.line("two");
    }
    w.line("one again");
  }
  EXPECT_EQ(w.text(), "zero\n  one\n    two\n  one again\n");
}

TEST_F(TraceWriterTest, LabelContinuesLine) {
  TraceWriter::DepthScope s0{w};
  w.line("top");
  {
    TraceWriter::DepthScope s1{w};
    w.label("  {}: ", "key");
    EXPECT_TRUE(w.is_label_pending());
    {
      TraceWriter::DepthScope s2{w};
      w.line("child");
      EXPECT_FALSE(w.is_label_pending());
      w.line("more");
    }
  }
  EXPECT_EQ(w.text(), "top\n    key: child\n    more\n");
}

TEST_F(TraceWriterTest, Release) {
  TraceWriter::DepthScope s0{w};
  w.line("{} != {}", 1, 2);
  auto text = w.release();
  EXPECT_EQ(text, "1 != 2\n");
  EXPECT_FALSE(w.is_label_pending());
}
