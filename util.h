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

#ifndef THIRD_PARTY_DIFFCOV_UTIL_H_
#define THIRD_PARTY_DIFFCOV_UTIL_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace diffcov {

// Reads the contents of the local file `file_path` into `data`.
// Returns NotFound if the file can't be opened, DataLoss if reading fails.
absl::Status ReadFromLocalFile(absl::string_view file_path, std::string &data);

// Writes `data` to the local file `file_path`, replacing its contents.
// Crashes on any error.
void WriteToLocalFile(absl::string_view file_path, absl::string_view data);

// Returns the name of `file_name` without its last extension:
// "t1.cov" => "t1", "t1" => "t1", "a.b.c" => "a.b", ".hidden" => ".hidden".
std::string FileStem(absl::string_view file_name);

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_UTIL_H_
