// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <cstdlib>

#include <absl/base/log_severity.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <gtest/gtest.h>

#include "msm/logging/logging.h"
#include "msm/pipeline/pipeline.h"

TEST(Logging, InitOnce) {
  msm::InitLogging(std::nullopt);
  msm::InitLogging(2);
  MSM_LOG(INFO) << "ok";
  auto* fn = &absl::InitializeLog;
  (void)fn;
}

TEST(Logging, InitFromEnvToleratesMalformedLevel) {
  setenv("MSM_LOG_LEVEL", "not-a-number", 1);
  msm::InitLoggingFromEnv();
  setenv("MSM_LOG_LEVEL", "1", 1);
  msm::InitLoggingFromEnv();
  unsetenv("MSM_LOG_LEVEL");
  msm::InitLoggingFromEnv();
  for (int i = 0; i < 10; ++i) {
    MSM_LOG_EVERY_N(INFO, 4) << "sampled " << i;
  }
  MSM_CHECK(true);
}

// The process pipeline is first touched here, so its construction reads
// MSM_LOG_LEVEL.
TEST(Logging, ProcessPipelineAppliesEnvLevel) {
  const absl::LogSeverityAtLeast prev = absl::MinLogLevel();
  setenv("MSM_LOG_LEVEL", "2", 1);
  (void)msm::pipeline::ValidationPipeline::get();
  EXPECT_EQ(absl::MinLogLevel(), absl::LogSeverityAtLeast::kError);
  unsetenv("MSM_LOG_LEVEL");
  absl::SetMinLogLevel(prev);
}
