// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <memory>
#include <vector>

#include "msm/control/quarantine_controller.h"

using msm::control::ContentionScope;
using msm::control::QuarantineController;

namespace {

void run_epochs(QuarantineController& qc, int epochs, std::uint64_t latency_ns, bool detect) {
  for (int e = 0; e < epochs; ++e) {
    for (std::uint64_t i = 0; i < QuarantineController::kEpochFrees; ++i) qc.record_free(latency_ns, detect);
  }
}

} // namespace

TEST(QuarantineControllerTest, EpochBoundary) {
  QuarantineController qc;
  EXPECT_EQ(qc.depth(), QuarantineController::kDefaultDepth);
  for (std::uint64_t i = 0; i + 1 < QuarantineController::kEpochFrees; ++i) {
    EXPECT_FALSE(qc.record_free(100, false));
  }
  EXPECT_TRUE(qc.record_free(100, false));
  const auto s = qc.summary();
  EXPECT_EQ(s.epochs, 1u);
  EXPECT_EQ(s.total_frees, QuarantineController::kEpochFrees);
  EXPECT_EQ(msm::control::published_quarantine_depth(), qc.depth());
}

TEST(QuarantineControllerTest, QuietWorkloadShrinksWithinBounds) {
  QuarantineController qc;
  run_epochs(qc, 200, 50, false);
  EXPECT_LT(qc.depth(), QuarantineController::kDefaultDepth);
  EXPECT_GE(qc.depth(), QuarantineController::kMinDepth);
  EXPECT_EQ(qc.summary().escape_rate, 0.0);
}

TEST(QuarantineControllerTest, DetectionsGrowDepth) {
  QuarantineController qc;
  run_epochs(qc, 3, 50, true);
  EXPECT_GT(qc.depth(), QuarantineController::kDefaultDepth);
  EXPECT_LE(qc.depth(), QuarantineController::kMaxDepth);
  const auto s = qc.summary();
  EXPECT_GT(s.escape_rate, 0.0);
  EXPECT_EQ(s.total_detections, 3 * QuarantineController::kEpochFrees);
}

TEST(QuarantineControllerTest, SlowFreesShrinkDepth) {
  QuarantineController qc;
  run_epochs(qc, 1, 2000000, false);
  EXPECT_LT(qc.depth(), QuarantineController::kDefaultDepth - 100);
  const auto s = qc.summary();
  EXPECT_GE(s.last_p99_ns, 2000000.0);
  EXPECT_GT(s.lambda_latency, 0.1);
}

TEST(QuarantineControllerTest, ContentionBoostsDepth) {
  QuarantineController qc;
  std::vector<std::unique_ptr<ContentionScope>> scopes;
  for (int i = 0; i < 8; ++i) scopes.push_back(std::make_unique<ContentionScope>(qc.contention()));
  EXPECT_EQ(qc.contention().current(), 8u);
  run_epochs(qc, 1, 50, false);
  scopes.clear();
  EXPECT_EQ(qc.contention().current(), 0u);
  EXPECT_GT(qc.depth(), QuarantineController::kDefaultDepth);
  EXPECT_EQ(qc.summary().last_contention_peak, 8u);
}
