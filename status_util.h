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

// Error kinds reported by diffcov, on top of absl::Status.
//
// Every error created here carries a payload naming its kind, so callers can
// distinguish e.g. an undefined ratio from an empty input even where the
// canonical status codes alone would be ambiguous.

#ifndef THIRD_PARTY_DIFFCOV_STATUS_UTIL_H_
#define THIRD_PARTY_DIFFCOV_STATUS_UTIL_H_

#include <optional>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace diffcov {

enum class ErrorKind {
  // A reducer was given zero elements: no approaches left after filtering,
  // an approach with zero trials, an empty sequence of ratios.
  kEmptyInput,
  // A ratio has a zero denominator: an empty relcov reference set, or an
  // approach without a single trial with non-empty coverage in relscore.
  kDivisionUndefined,
  // A referenced approach (reference fuzzer, input corpus) is absent or
  // unsuitable.
  kMissingApproach,
  // A coverage file could not be parsed.
  kMalformedCoverageRecord,
};

// Type URL of the payload that carries the ErrorKind.
inline constexpr absl::string_view kErrorKindPayloadUrl = "diffcov.ErrorKind";

// Returns a printable name of `kind`, e.g. "EmptyInputError".
absl::string_view ErrorKindName(ErrorKind kind);

// Constructors for each kind. Status codes are:
// kEmptyInput: InvalidArgument, kDivisionUndefined: FailedPrecondition,
// kMissingApproach: NotFound, kMalformedCoverageRecord: DataLoss.
absl::Status EmptyInputError(absl::string_view message);
absl::Status DivisionUndefinedError(absl::string_view message);
absl::Status MissingApproachError(absl::string_view message);
absl::Status MalformedCoverageRecordError(absl::string_view message);

// Returns the kind attached to `status`, or nullopt if `status` is OK or was
// not created by one of the functions above.
std::optional<ErrorKind> GetErrorKind(const absl::Status &status);

bool IsEmptyInput(const absl::Status &status);
bool IsDivisionUndefined(const absl::Status &status);
bool IsMissingApproach(const absl::Status &status);
bool IsMalformedCoverageRecord(const absl::Status &status);

}  // namespace diffcov

// Evaluates `expr` (an absl::Status) and returns it from the enclosing
// function if it is not OK.
#define DIFFCOV_RETURN_IF_ERROR(expr)            \
  do {                                           \
    const ::absl::Status _diffcov_st = (expr);   \
    if (!_diffcov_st.ok()) return _diffcov_st;   \
  } while (0)

#endif  // THIRD_PARTY_DIFFCOV_STATUS_UTIL_H_
