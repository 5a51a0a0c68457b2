// Copyright 2024 The Diffcov Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef THIRD_PARTY_DIFFCOV_ENVIRONMENT_H_
#define THIRD_PARTY_DIFFCOV_ENVIRONMENT_H_

#include <cstddef>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "./output.h"
#include "./reducer.h"

namespace diffcov {

// The analyses the command line can run.
enum class Command {
  kRelscore,                 // "relscore"
  kRelcov,                   // "relcov"
  kRelcovReliability,        // "relcov-reliability"
  kRelcovPerformanceFuzzer,  // "relcov-performance-fuzzer"
  kRelcovPerformanceCorpus,  // "relcov-performance-corpus"
};

absl::string_view CommandName(Command command);
bool ParseCommand(absl::string_view name, Command &command);

// Validated, typed view of an Environment. See Environment::Resolve().
struct RunConfig {
  Command command = Command::kRelscore;
  std::string campaign_dir;
  OutputOptions output;
  ValueReducer value_reducer = ValueReducer::kMedian;
  CollectionReducer collection_reducer = CollectionReducer::kUnion;
};

// Settings that are initialized at startup and don't change.
// Data fields are copied from the FLAGS defined in environment.cc.
// See FLAGS descriptions for comments.
// Users or tests can override any of the fields after the object is
// constructed, but before it is passed to DiffcovMain.
struct Environment {
  // `argv` holds the positional arguments left after flag parsing, with the
  // program name first: {exec_name, command, campaign_dir}.
  explicit Environment(const std::vector<std::string> &argv = {});

  std::vector<std::string> include_approach;
  std::vector<std::string> exclude_approach;
  std::string output;
  std::string latex_rotate_headers;
  bool latex_enable_color;
  std::string latex_colormap;
  std::string value_reducer;
  std::string collection_reducer;
  std::string reference;
  size_t num_threads;

  // Set to zero to reduce logging in tests.
  size_t log_level = 1;

  std::string exec_name;          // copied from argv[0]
  std::vector<std::string> args;  // copied from argv[1:].

  // Parses and checks the string-valued settings and positional arguments.
  // Returns InvalidArgument describing the first usage error.
  absl::StatusOr<RunConfig> Resolve() const;
};

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_ENVIRONMENT_H_
