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

#include <iostream>
#include <string>
#include <vector>

#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "./diffcov_interface.h"
#include "./environment.h"

int main(int argc, char **argv) {
  absl::SetProgramUsageMessage(
      "Differential coverage analysis of fuzzing campaigns.\n"
      "Usage: diffcov [flags] <command> <campaign_dir>\n"
      "Commands: relscore, relcov, relcov-reliability,\n"
      "  relcov-performance-fuzzer, relcov-performance-corpus\n"
      "<campaign_dir> holds one directory per approach, each holding one\n"
      "afl-showmap coverage file per trial.");
  // Parse the command line.
  std::vector<char *> args = absl::ParseCommandLine(argc, argv);

  // Reads flags; must happen after ParseCommandLine().
  diffcov::Environment env(std::vector<std::string>{args.begin(), args.end()});
  return diffcov::DiffcovMain(env, std::cout);
}
