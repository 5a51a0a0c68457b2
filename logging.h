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

// A rudimentary logging interface similar to a subset of "base/logging.h".
// Messages go to stderr, one write per message, so that lines logged from
// different threads don't interleave.

#ifndef THIRD_PARTY_DIFFCOV_LOGGING_H_
#define THIRD_PARTY_DIFFCOV_LOGGING_H_

#include <stdlib.h>

#include <iostream>
#include <sstream>
#include <string_view>

namespace diffcov {

enum class LogSeverity { kINFO, kWARNING, kERROR, kFATAL };

class TinyLogger {
 public:
  TinyLogger(std::string_view file, int line, LogSeverity severity)
      : severity_{severity} {
    static constexpr char kSeverityChars[] = {'I', 'W', 'E', 'F'};
    stream_ << kSeverityChars[static_cast<int>(severity)] << " " << file << ":"
            << line << "] ";
  }
  ~TinyLogger() {
    stream_ << "\n";
    std::cerr << stream_.str() << std::flush;
    if (severity_ == LogSeverity::kFATAL) abort();
  }
  template <typename Type>
  TinyLogger &operator<<(const Type &data) {
    stream_ << data;
    return *this;
  }

 private:
  const LogSeverity severity_;
  std::ostringstream stream_;
};

}  // namespace diffcov

#define LOG_IMPL(severity) \
  ::diffcov::TinyLogger { __FILE__, __LINE__, (severity) }
#undef LOG
#define LOG(severity) LOG_IMPL(::diffcov::LogSeverity::k##severity)
#undef VLOG
#define VLOG(logging_level) LOG(INFO)  // ignore logging_level

#undef CHECK_COND
   // NOTE: The `if` is intentionally dangling to allow trailing `<<`s.
   // clang-format off
#define CHECK_COND(a, b, cond) \
  if (!((a)cond(b)))                                                  \
    LOG_IMPL(::diffcov::LogSeverity::kFATAL)                          \
        << "Check failed: " << #a << #cond << #b                      \
        << " [" << (a) << #cond << (b) << "] "
   // clang-format on
#undef CHECK_EQ
#define CHECK_EQ(a, b) CHECK_COND(a, b, ==)
#undef CHECK_NE
#define CHECK_NE(a, b) CHECK_COND(a, b, !=)
#undef CHECK_GT
#define CHECK_GT(a, b) CHECK_COND(a, b, >)
#undef CHECK_GE
#define CHECK_GE(a, b) CHECK_COND(a, b, >=)
#undef CHECK_LT
#define CHECK_LT(a, b) CHECK_COND(a, b, <)
#undef CHECK_LE
#define CHECK_LE(a, b) CHECK_COND(a, b, <=)
#undef CHECK
#define CHECK(condition) CHECK_NE(!!(condition), false)

// Easy variable value logging: LOG(INFO) << VV(foo) << VV(bar);
#define VV(x) #x "=" << (x) << " "

#endif  // THIRD_PARTY_DIFFCOV_LOGGING_H_
