// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Status propagation helpers used across procjail. Mirrors the usual
// RETURN_IF_ERROR / ASSIGN_OR_RETURN pair.

#ifndef PROCJAIL_UTIL_STATUS_MACROS_H_
#define PROCJAIL_UTIL_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

// Internal helper for concatenating macro values.
#define PROCJAIL_MACROS_IMPL_CONCAT_INNER_(x, y) x##y
#define PROCJAIL_MACROS_IMPL_CONCAT(x, y) PROCJAIL_MACROS_IMPL_CONCAT_INNER_(x, y)

#define PROCJAIL_RETURN_IF_ERROR(expr) \
  PROCJAIL_RETURN_IF_ERROR_IMPL(       \
      PROCJAIL_MACROS_IMPL_CONCAT(_procjail_status, __LINE__), expr)

#define PROCJAIL_RETURN_IF_ERROR_IMPL(status, expr) \
  do {                                              \
    const auto status = (expr);                     \
    if (ABSL_PREDICT_FALSE(!status.ok())) {         \
      return status;                                \
    }                                               \
  } while (0)

#define PROCJAIL_ASSIGN_OR_RETURN(lhs, rexpr) \
  PROCJAIL_ASSIGN_OR_RETURN_IMPL(             \
      PROCJAIL_MACROS_IMPL_CONCAT(_procjail_statusor, __LINE__), lhs, rexpr)

#define PROCJAIL_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                   \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                  \
    return statusor.status();                                \
  }                                                          \
  lhs = std::move(statusor).value()

#endif  // PROCJAIL_UTIL_STATUS_MACROS_H_
