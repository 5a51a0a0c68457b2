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

#ifndef THIRD_PARTY_DIFFCOV_DIFFCOV_INTERFACE_H_
#define THIRD_PARTY_DIFFCOV_DIFFCOV_INTERFACE_H_

#include <ostream>

#include "absl/status/status.h"
#include "./environment.h"

namespace diffcov {

// Reads the campaign directory of `config`, applies the approach filter of
// `env`, runs `config.command` and prints the result to `out`.
// Progress and the campaign summary are logged according to env.log_level.
absl::Status RunCommand(const Environment &env, const RunConfig &config,
                        std::ostream &out);

// The main entry point: resolves `env`, then calls RunCommand().
// Reports failures on stderr.
// Returns EXIT_SUCCESS on success, EXIT_FAILURE otherwise.
int DiffcovMain(const Environment &env, std::ostream &out);

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_DIFFCOV_INTERFACE_H_
