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

#pragma once

#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include "swoc/TextView.h"
#include "swoc/bwf_base.h"

#include "deepeq/render.h"

namespace deepeq
{
/** Accumulate the trace text.
 *
 * Each line is indented two spaces per depth level. A label leaves the current line open so that
 * the next line, usually the first line of a nested comparison, continues it without indentation.
 * Text is formatted with BufferWriter format strings.
 */
class TraceWriter
{
public:
  using self_type = TraceWriter;

  /// Indent unit.
  static constexpr std::string_view INDENT{"  "};

  /// Scoped depth increment.
  class DepthScope
  {
  public:
    explicit DepthScope(TraceWriter &w);
    ~DepthScope();
    DepthScope(DepthScope const &) = delete;
    DepthScope &operator=(DepthScope const &) = delete;

  protected:
    TraceWriter &_w;
  };

  /// Write a complete line.
  template <typename... Args> self_type &line(swoc::TextView fmt, Args &&... args);

  /// Write a label and leave the line open for the next line.
  template <typename... Args> self_type &label(swoc::TextView fmt, Args &&... args);

  void indent(); ///< Increase the depth.
  void exdent(); ///< Decrease the depth.
  int depth() const;
  /// Check if a label is waiting for its continuation.
  bool is_label_pending() const;

  std::string const &text() const;
  /// Move the text out of the writer.
  std::string release();

protected:
  /// Internal output, applies the indentation unless a label is pending.
  void out(swoc::TextView text);

  /// Nesting depth. This starts below zero so the first line of a comparison is not indented.
  int _depth{-1};
  bool _label_p{false}; ///< Label written, next line continues it.
  std::string _text;    ///< Accumulated trace.
  std::string _tmp;     ///< Formatting buffer, kept for memory reuse.
};

// --- Implementation

inline TraceWriter::DepthScope::DepthScope(TraceWriter &w) : _w(w)
{
  _w.indent();
}

inline TraceWriter::DepthScope::~DepthScope()
{
  _w.exdent();
}

template <typename... Args>
TraceWriter &
TraceWriter::line(swoc::TextView fmt, Args &&... args)
{
  swoc::bwprint_v(_tmp, fmt, std::forward_as_tuple(args...));
  this->out(_tmp);
  _text += '\n';
  return *this;
}

template <typename... Args>
TraceWriter &
TraceWriter::label(swoc::TextView fmt, Args &&... args)
{
  swoc::bwprint_v(_tmp, fmt, std::forward_as_tuple(args...));
  this->out(_tmp);
  _label_p = true;
  return *this;
}

inline void
TraceWriter::indent()
{
  ++_depth;
}

inline void
TraceWriter::exdent()
{
  --_depth;
}

inline int
TraceWriter::depth() const
{
  return _depth;
}

inline bool
TraceWriter::is_label_pending() const
{
  return _label_p;
}

inline std::string const &
TraceWriter::text() const
{
  return _text;
}

} // namespace deepeq
