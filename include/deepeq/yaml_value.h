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

#pragma once

#include "swoc/Errata.h"
#include "swoc/TextView.h"
#include "swoc/swoc_file.h"

#include "yaml-cpp/yaml.h"

#include "deepeq/heap.h"
#include "deepeq/type.h"
#include "deepeq/value.h"

namespace deepeq
{
struct YamlOptions {
  /// Convert plain scalars that read as booleans, integers or floats to those types.
  bool typed_scalars{false};
};

/** Convert YAML nodes to values.
 *
 * Every node becomes a value of the variant type @c any - null nodes are absent variants,
 * sequences hold a @c []any slice, maps hold a @c map[string]any and scalars hold a string, or with
 * @c YamlOptions::typed_scalars the typed scalar.
 *
 * Values from one loader share types and can be compared, values from different loaders have
 * distinct types.
 */
class YamlLoader
{
public:
  YamlLoader(Heap &heap, TypeTable &types, YamlOptions const &opts = {});

  swoc::Rv<Value> convert(YAML::Node const &node);
  /// Parse @a content and convert it. @a name identifies the content in messages.
  swoc::Rv<Value> parse(swoc::TextView content, swoc::TextView name = swoc::TextView{"<input>"});
  /// Load the YAML file @a path and convert it.
  swoc::Rv<Value> load(swoc::file::path const &path);

  Type const *any_type() const;
  Type const *list_type() const;
  Type const *dict_type() const;

protected:
  Value value_of(YAML::Node const &node, swoc::Errata &errata);
  Value scalar_of(YAML::Node const &node);

  Heap &_heap;
  YamlOptions _opts;
  Type const *_any;  ///< @c any
  Type const *_list; ///< @c []any
  Type const *_dict; ///< @c map[string]any
};

inline Type const *
YamlLoader::any_type() const
{
  return _any;
}

inline Type const *
YamlLoader::list_type() const
{
  return _list;
}

inline Type const *
YamlLoader::dict_type() const
{
  return _dict;
}

} // namespace deepeq
