// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <optional>
#include <absl/log/check.h>
#include <absl/log/log.h>

namespace msm {
// Initialize Abseil logging once; optionally set min log level.
void InitLogging(std::optional<int> min_level);

// Reads MSM_LOG_LEVEL (0=INFO .. 3=FATAL) and forwards to InitLogging.
void InitLoggingFromEnv();
}

#define MSM_LOG(level) LOG(level)
#define MSM_LOG_EVERY_N(level, n) LOG_EVERY_N(level, n)
#define MSM_CHECK(cond) CHECK(cond)
