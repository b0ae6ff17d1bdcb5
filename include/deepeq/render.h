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

#pragma once

#include "swoc/bwf_base.h"

#include "deepeq/type.h"
#include "deepeq/value.h"

namespace deepeq
{
/// Aggregates nested deeper than this are rendered as "...".
static constexpr int RENDER_DEPTH_LIMIT = 8;
} // namespace deepeq

namespace swoc
{
BufferWriter &bwformat(BufferWriter &w, bwf::Spec const &spec, deepeq::Kind kind);
BufferWriter &bwformat(BufferWriter &w, bwf::Spec const &spec, deepeq::Type const &type);
/** Render a value.
 *
 * Strings are quoted, null containers are rendered as the type name followed by "(null)", and
 * references are never followed so rendering cyclic data terminates.
 */
BufferWriter &bwformat(BufferWriter &w, bwf::Spec const &spec, deepeq::Value const &value);
BufferWriter &bwformat(BufferWriter &w, bwf::Spec const &spec, deepeq::View const &view);
} // namespace swoc
