/** @file

    Indented, line oriented log of comparison decisions.

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

#include "deepeq/trace_writer.h"

namespace deepeq
{
void
TraceWriter::out(swoc::TextView text)
{
  if (_label_p) { // continuing the label line, no indentation.
    _label_p = false;
  } else {
    for (int i = _depth; i > 0; --i) {
      _text.append(INDENT.data(), INDENT.size());
    }
  }
  _text.append(text.data(), text.size());
}

std::string
TraceWriter::release()
{
  _label_p = false;
  return std::move(_text);
}

} // namespace deepeq
