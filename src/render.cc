/** @file

    BufferWriter formatting for the value model.

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

#include <string_view>

#include "deepeq/heap.h"
#include "deepeq/render.h"

using namespace std::literals;
using swoc::BufferWriter;
using swoc::TextView;

namespace deepeq
{
namespace
{
void render(BufferWriter &w, Value const &v, int depth);

void
render_string(BufferWriter &w, std::string const &s)
{
  static constexpr char HEX[] = "0123456789abcdef";
  w.write('"');
  for (char c : s) {
    switch (c) {
    case '"':
      w.write("\\\""sv);
      break;
    case '\\':
      w.write("\\\\"sv);
      break;
    case '\n':
      w.write("\\n"sv);
      break;
    case '\t':
      w.write("\\t"sv);
      break;
    case '\r':
      w.write("\\r"sv);
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        auto u = static_cast<unsigned char>(c);
        w.write("\\x"sv);
        w.write(HEX[u >> 4]);
        w.write(HEX[u & 0xF]);
      } else {
        w.write(c);
      }
      break;
    }
  }
  w.write('"');
}

void
render_scalar(BufferWriter &w, Value const &v)
{
  switch (v.type()->scalar()) {
  case ScalarType::BOOL:
    w.write(v.as_bool() ? "true"sv : "false"sv);
    break;
  case ScalarType::INTEGER:
    w.print("{}", v.as_integer());
    break;
  case ScalarType::FLOAT:
    w.print("{}", v.as_float());
    break;
  case ScalarType::STRING:
    render_string(w, v.as_string());
    break;
  case ScalarType::NONE:
    w.write("<none>"sv);
    break;
  }
}

// Elements of an array or slice, without the enclosing type.
void
render_sequence(BufferWriter &w, Value const &v, int depth)
{
  TextView delimiter;
  w.write('{');
  for (std::size_t i = 0, n = v.size(); i < n; ++i) {
    w.write(delimiter);
    render(w, v.at(i), depth + 1);
    delimiter.assign(", ");
  }
  w.write('}');
}

void
render(BufferWriter &w, Value const &v, int depth)
{
  if (!v.is_valid()) {
    w.write("<invalid>"sv);
    return;
  }

  auto const &name = v.type()->name();
  if (v.is_null()) {
    w.print("{}(null)", name);
    return;
  }

  switch (v.kind()) {
  case Kind::INVALID:
    break;
  case Kind::SCALAR:
    render_scalar(w, v);
    return;
  case Kind::VARIANT:
    render(w, *v.boxed(), depth);
    return;
  case Kind::REFERENCE:
    w.print("({})@{}", name, v.cell()->id());
    return;
  case Kind::CALLABLE:
    w.write(name).write("{...}"sv);
    return;
  default:
    break;
  }

  // Aggregates from here on.
  w.write(name);
  if (depth >= RENDER_DEPTH_LIMIT) {
    w.write("{...}"sv);
    return;
  }

  switch (v.kind()) {
  case Kind::ARRAY:
  case Kind::SLICE:
    render_sequence(w, v, depth);
    break;
  case Kind::RECORD: {
    TextView delimiter;
    auto const &fields = v.type()->fields();
    auto const &elts   = v.elements();
    w.write('{');
    for (std::size_t i = 0; i < fields.size() && i < elts.size(); ++i) {
      w.print("{}{}:", delimiter, fields[i].name);
      render(w, elts[i], depth + 1);
      delimiter.assign(", ");
    }
    w.write('}');
    break;
  }
  case Kind::MAP: {
    TextView delimiter;
    w.write('{');
    for (auto const &[key, value] : v.map()->entries()) {
      w.write(delimiter);
      render(w, key, depth + 1);
      w.write(':');
      render(w, value, depth + 1);
      delimiter.assign(", ");
    }
    w.write('}');
    break;
  }
  default:
    break;
  }
}

} // namespace
} // namespace deepeq

namespace swoc
{
BufferWriter &
bwformat(BufferWriter &w, bwf::Spec const &spec, deepeq::Kind kind)
{
  return bwformat(w, spec, deepeq::KindLexicon[kind]);
}

BufferWriter &
bwformat(BufferWriter &w, bwf::Spec const &spec, deepeq::Type const &type)
{
  return bwformat(w, spec, std::string_view{type.name()});
}

BufferWriter &
bwformat(BufferWriter &w, bwf::Spec const &, deepeq::Value const &value)
{
  deepeq::render(w, value, 0);
  return w;
}

BufferWriter &
bwformat(BufferWriter &w, bwf::Spec const &spec, deepeq::View const &view)
{
  if (!view.is_valid()) {
    return bwformat(w, spec, "<invalid>"sv);
  }
  return bwformat(w, spec, view.value());
}

} // namespace swoc
