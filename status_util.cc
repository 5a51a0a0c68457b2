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

#include "./status_util.h"

#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/string_view.h"

namespace diffcov {

namespace {

absl::Status MakeError(absl::StatusCode code, ErrorKind kind,
                       absl::string_view message) {
  absl::Status status(code, message);
  status.SetPayload(kErrorKindPayloadUrl, absl::Cord(ErrorKindName(kind)));
  return status;
}

}  // namespace

absl::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kEmptyInput:
      return "EmptyInputError";
    case ErrorKind::kDivisionUndefined:
      return "DivisionUndefined";
    case ErrorKind::kMissingApproach:
      return "MissingApproachError";
    case ErrorKind::kMalformedCoverageRecord:
      return "MalformedCoverageRecord";
  }
  return "UnknownError";
}

absl::Status EmptyInputError(absl::string_view message) {
  return MakeError(absl::StatusCode::kInvalidArgument, ErrorKind::kEmptyInput,
                   message);
}

absl::Status DivisionUndefinedError(absl::string_view message) {
  return MakeError(absl::StatusCode::kFailedPrecondition,
                   ErrorKind::kDivisionUndefined, message);
}

absl::Status MissingApproachError(absl::string_view message) {
  return MakeError(absl::StatusCode::kNotFound, ErrorKind::kMissingApproach,
                   message);
}

absl::Status MalformedCoverageRecordError(absl::string_view message) {
  return MakeError(absl::StatusCode::kDataLoss,
                   ErrorKind::kMalformedCoverageRecord, message);
}

std::optional<ErrorKind> GetErrorKind(const absl::Status &status) {
  if (status.ok()) return std::nullopt;
  auto payload = status.GetPayload(kErrorKindPayloadUrl);
  if (!payload.has_value()) return std::nullopt;
  const std::string name(*payload);
  for (auto kind : {ErrorKind::kEmptyInput, ErrorKind::kDivisionUndefined,
                    ErrorKind::kMissingApproach,
                    ErrorKind::kMalformedCoverageRecord}) {
    if (name == ErrorKindName(kind)) return kind;
  }
  return std::nullopt;
}

bool IsEmptyInput(const absl::Status &status) {
  return GetErrorKind(status) == ErrorKind::kEmptyInput;
}

bool IsDivisionUndefined(const absl::Status &status) {
  return GetErrorKind(status) == ErrorKind::kDivisionUndefined;
}

bool IsMissingApproach(const absl::Status &status) {
  return GetErrorKind(status) == ErrorKind::kMissingApproach;
}

bool IsMalformedCoverageRecord(const absl::Status &status) {
  return GetErrorKind(status) == ErrorKind::kMalformedCoverageRecord;
}

}  // namespace diffcov
