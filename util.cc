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

#include "./util.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "./logging.h"

namespace diffcov {

absl::Status ReadFromLocalFile(absl::string_view file_path, std::string &data) {
  std::ifstream f(std::string{file_path});
  if (!f) {
    return absl::NotFoundError(
        absl::StrCat("Failed to open local file: ", file_path));
  }
  std::ostringstream contents;
  contents << f.rdbuf();
  if (f.bad()) {
    return absl::DataLossError(
        absl::StrCat("Failed to read from local file: ", file_path));
  }
  data = contents.str();
  return absl::OkStatus();
}

void WriteToLocalFile(absl::string_view file_path, absl::string_view data) {
  std::ofstream f(std::string{file_path});
  CHECK(f) << "Failed to open local file: " << file_path;
  f.write(data.data(), data.size());
  CHECK(f) << "Failed to write to local file: " << file_path;
  f.close();
}

std::string FileStem(absl::string_view file_name) {
  return std::filesystem::path(std::string{file_name}).stem().string();
}

}  // namespace diffcov
