/** @file

    Conversion of YAML documents to values.

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

#include <cctype>
#include <cerrno>
#include <cinttypes>
#include <cstdlib>
#include <string>
#include <strings.h>
#include <system_error>

#include "swoc/bwf_base.h"

#include "deepeq/yaml_value.h"

using swoc::Errata;
using swoc::Rv;
using swoc::TextView;

namespace deepeq
{
namespace
{
// yaml-cpp tags plain scalars with "?" and quoted scalars with "!". Only plain scalars are typed.
bool
is_plain(YAML::Node const &node)
{
  return node.Tag() != "!";
}

bool
is_space(char c)
{
  return std::isspace(static_cast<unsigned char>(c));
}

} // namespace

YamlLoader::YamlLoader(Heap &heap, TypeTable &types, YamlOptions const &opts) : _heap(heap), _opts(opts)
{
  _any  = types.variant("any");
  _list = types.slice_of(_any);
  _dict = types.map_of(Type::string(), _any);
}

Value
YamlLoader::scalar_of(YAML::Node const &node)
{
  auto const &text = node.Scalar();

  if (_opts.typed_scalars && is_plain(node)) {
    if (0 == strcasecmp("true", text.c_str())) {
      return Value::boolean(true);
    }
    if (0 == strcasecmp("false", text.c_str())) {
      return Value::boolean(false);
    }

    TextView value{text};
    value.trim_if(&is_space);
    if (value.size() > 0 && value.size() == text.size()) {
      TextView parsed;
      auto n = swoc::svtoi(value, &parsed);
      if (parsed.size() == value.size()) {
        // svtoi does not detect overflow, out of range integers are kept as text.
        errno = 0;
        std::strtoimax(text.c_str(), nullptr, 10);
        if (errno == ERANGE) {
          return Value::string(text);
        }
        return Value::integer(n);
      }
      char *end = nullptr;
      auto d    = std::strtod(text.c_str(), &end);
      if (end == text.c_str() + text.size()) {
        return Value::floating(d);
      }
    }
  }
  return Value::string(text);
}

Value
YamlLoader::value_of(YAML::Node const &node, Errata &errata)
{
  switch (node.Type()) {
  case YAML::NodeType::Undefined:
  case YAML::NodeType::Null:
    return Value::zero(_any);
  case YAML::NodeType::Scalar:
    return Value::variant(_any, this->scalar_of(node));
  case YAML::NodeType::Sequence: {
    Value::Elements elts;
    elts.reserve(node.size());
    for (auto const &n : node) {
      elts.push_back(this->value_of(n, errata));
    }
    return Value::variant(_any, _heap.make_slice(_list, std::move(elts)));
  }
  case YAML::NodeType::Map: {
    auto map = _heap.make_map(_dict);
    for (auto const &pair : node) {
      auto const &key = pair.first;
      if (!key.IsScalar()) {
        errata.error("Key at line {} in the map at line {} is not a scalar - entry ignored.", key.Mark().line + 1,
                     node.Mark().line + 1);
        continue;
      }
      if (!map.map()->insert(Value::string(key.Scalar()), this->value_of(pair.second, errata))) {
        errata.warn("Key '{}' at line {} is a duplicate - the later value is used.", key.Scalar(), key.Mark().line + 1);
      }
    }
    return Value::variant(_any, std::move(map));
  }
  }
  return Value::zero(_any);
}

Rv<Value>
YamlLoader::convert(YAML::Node const &node)
{
  Rv<Value> zret;
  zret.result() = this->value_of(node, zret.errata());
  return zret;
}

Rv<Value>
YamlLoader::parse(TextView content, TextView name)
{
  Rv<Value> zret;
  YAML::Node root;
  try {
    root = YAML::Load(std::string(content.data(), content.size()));
  } catch (std::exception &ex) {
    zret.errata().error("Unable to parse '{}' - {}", name, ex.what());
    return zret;
  }
  zret.result() = this->value_of(root, zret.errata());
  return zret;
}

Rv<Value>
YamlLoader::load(swoc::file::path const &path)
{
  Rv<Value> zret;
  std::error_code ec;
  std::string content = swoc::file::load(path, ec);
  TextView name{path.c_str()};

  if (ec) {
    zret.errata().error("Unable to load '{}' - {}", name, ec.message());
    return zret;
  }
  zret.errata().info("Loaded '{}' - {} bytes", name, content.size());

  auto rv = this->parse(content, name);
  zret.errata().note(std::move(rv.errata()));
  zret.result() = std::move(rv.result());
  return zret;
}

} // namespace deepeq
