/** @file

    Compare two YAML files for deep equality and explain the verdict.

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

#include <array>
#include <getopt.h>
#include <iostream>
#include <string>
#include <unistd.h>

#include "swoc/Errata.h"
#include "swoc/Lexicon.h"
#include "swoc/TextView.h"
#include "swoc/bwf_base.h"
#include "swoc/swoc_file.h"

#include "deepeq/deep_equal.h"
#include "deepeq/heap.h"
#include "deepeq/type.h"
#include "deepeq/yaml_value.h"

using swoc::Errata;
using swoc::Severity;
using swoc::TextView;

namespace
{
// Command line options.
std::array<option, 5> Options = {{{"quiet", 0, nullptr, 'q'},
                                  {"typed", 0, nullptr, 't'},
                                  {"verbose", 0, nullptr, 'v'},
                                  {"help", 0, nullptr, 'h'},
                                  {nullptr, 0, nullptr, 0}}};

const std::string USAGE{R"(Usage: yamleq [options] LEFT RIGHT
Compare two YAML files and print the trace of the comparison.

  -q, --quiet    Print only the verdict.
  -t, --typed    Compare plain scalars as booleans and numbers where possible.
  -v, --verbose  Print informational notes.
  -h, --help     Print this text.

Exit status is 0 if the files are equal, 1 if not, 2 if there was a problem.
)"};

/// Process exit status.
enum class Status { EQUAL = 0, DIFFERENT = 1, TROUBLE = 2 };

// Verdict line for the status.
swoc::Lexicon<Status> StatusLexicon{{
  {Status::EQUAL, "equal"},
  {Status::DIFFERENT, "not equal"},
  {Status::TROUBLE, "unable to compare"},
}};

} // namespace

/// Context carried through the comparison.
struct Context {
  std::string left_path;  ///< Path to the left file.
  std::string right_path; ///< Path to the right file.
  bool quiet_p{false};    ///< Suppress the trace.
  bool verbose_p{false};  ///< Show informational notes.
  bool help_p{false};     ///< Usage requested.
  Errata notes;           ///< Errors / notes encountered.
  Status status{Status::TROUBLE};

  deepeq::YamlOptions yaml_opts;
  deepeq::TypeTable types; ///< Types shared by both documents.
  deepeq::Heap heap;       ///< Storage for both documents.
};

Errata &
process(Context &ctx, int argc, char *argv[])
{
  int zret;
  int idx;

  while (-1 != (zret = getopt_long(argc, argv, ":qtvh", Options.data(), &idx))) {
    switch (zret) {
    case 'q':
      ctx.quiet_p = true;
      break;
    case 't':
      ctx.yaml_opts.typed_scalars = true;
      break;
    case 'v':
      ctx.verbose_p = true;
      break;
    case 'h':
      ctx.help_p = true;
      break;
    default:
      ctx.notes.warn("Unknown option '{}' - ignored", argv[optind - 1]);
      break;
    }
  }

  if (ctx.help_p) {
    std::cout << USAGE;
    ctx.status = Status::EQUAL;
    return ctx.notes;
  }

  if (argc - optind != 2) {
    return ctx.notes.error("Two input files are required - see '--help'.");
  }
  ctx.left_path  = argv[optind];
  ctx.right_path = argv[optind + 1];

  deepeq::YamlLoader loader{ctx.heap, ctx.types, ctx.yaml_opts};

  auto lhs = loader.load(swoc::file::path{ctx.left_path});
  ctx.notes.note(std::move(lhs.errata()));
  auto rhs = loader.load(swoc::file::path{ctx.right_path});
  ctx.notes.note(std::move(rhs.errata()));

  if (ctx.notes.severity() >= Severity::ERROR) {
    return ctx.notes.error("Comparison of '{}' and '{}' abandoned.", ctx.left_path, ctx.right_path);
  }

  auto result = deepeq::deep_equal(lhs.result(), rhs.result());
  ctx.status  = result.equal ? Status::EQUAL : Status::DIFFERENT;
  ctx.notes.info("Compared '{}' and '{}' - {} heap stores, trace is {} bytes", ctx.left_path, ctx.right_path,
                 ctx.heap.count(), result.trace.size());

  if (!ctx.quiet_p) {
    std::cout << result.trace;
  }
  std::cout << StatusLexicon[ctx.status] << std::endl;

  return ctx.notes;
}

int
main(int argc, char *argv[])
{
  Context ctx;
  auto &&result = process(ctx, argc, argv);
  for (auto &&note : result) {
    if (ctx.verbose_p || note.severity() >= Severity::WARN) {
      std::cout << note.text() << std::endl;
    }
  }
  return result.severity() >= Severity::ERROR ? int(Status::TROUBLE) : int(ctx.status);
}
