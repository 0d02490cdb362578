// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/logging/logging.h"
#include <cerrno>
#include <cstdlib>
#include <mutex>
#include <absl/log/initialize.h>
#include <absl/log/globals.h>
#include <absl/base/log_severity.h>

namespace msm {
namespace {
std::once_flag g_once;
}

void InitLogging(std::optional<int> min_level) {
  std::call_once(g_once, [] { absl::InitializeLog(); });
  if (min_level) {
    absl::SetMinLogLevel(static_cast<absl::LogSeverityAtLeast>(
        absl::NormalizeLogSeverity(*min_level)));
  }
}

void InitLoggingFromEnv() {
  const char* env = std::getenv("MSM_LOG_LEVEL");
  if (!env || !*env) {
    InitLogging(std::nullopt);
    return;
  }
  char* end = nullptr;
  errno = 0;
  long v = std::strtol(env, &end, 10);
  if (errno != 0 || (end && *end != '\0')) {
    InitLogging(std::nullopt);
    MSM_LOG(WARNING) << "ignoring malformed MSM_LOG_LEVEL=" << env;
    return;
  }
  InitLogging(static_cast<int>(v));
}

}  // namespace msm
