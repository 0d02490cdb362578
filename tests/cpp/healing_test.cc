// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include "msm/pipeline/healing.h"

using msm::arena::FreeResult;
using msm::core::SafetyLevel;
using msm::pipeline::HealingAction;
using msm::pipeline::HealingPolicy;
using msm::pipeline::HealKind;

TEST(HealingTest, CopyBoundsClampToSmallestKnownRegion) {
  HealingPolicy h;
  EXPECT_FALSE(h.heal_copy_bounds(100, std::nullopt, std::nullopt).is_heal());
  EXPECT_FALSE(h.heal_copy_bounds(16, 32, 16).is_heal());

  const HealingAction both = h.heal_copy_bounds(100, 32, 16);
  EXPECT_EQ(both.kind, HealKind::ClampSize);
  EXPECT_EQ(both.requested, 100u);
  EXPECT_EQ(both.value, 16u);

  EXPECT_EQ(h.heal_copy_bounds(100, 40, std::nullopt).value, 40u);
  EXPECT_EQ(h.heal_copy_bounds(100, std::nullopt, 8).value, 8u);
}

TEST(HealingTest, StringBoundsLeaveRoomForTerminator) {
  HealingPolicy h;
  EXPECT_FALSE(h.heal_string_bounds(10, std::nullopt).is_heal());
  EXPECT_FALSE(h.heal_string_bounds(15, 16).is_heal());

  const HealingAction a = h.heal_string_bounds(16, 16);
  EXPECT_EQ(a.kind, HealKind::TruncateWithNull);
  EXPECT_EQ(a.value, 15u);
  EXPECT_EQ(h.heal_string_bounds(5, 0).value, 0u);
}

TEST(HealingTest, FreeResultsMapToIgnores) {
  HealingPolicy h;
  EXPECT_EQ(h.for_free_result(FreeResult::DoubleFree).kind, HealKind::IgnoreDoubleFree);
  EXPECT_EQ(h.for_free_result(FreeResult::ForeignPointer).kind, HealKind::IgnoreForeignFree);
  EXPECT_EQ(h.for_free_result(FreeResult::InvalidPointer).kind, HealKind::IgnoreForeignFree);
  EXPECT_FALSE(h.for_free_result(FreeResult::Freed).is_heal());
  EXPECT_FALSE(h.for_free_result(FreeResult::FreedWithCanaryCorruption).is_heal());
  EXPECT_EQ(h.realloc_as_malloc(24), (HealingAction{HealKind::ReallocAsMalloc, 24, 24}));
}

TEST(HealingTest, ApplyRespectsSafetyLevel) {
  HealingPolicy h;
  const HealingAction clamp = h.heal_copy_bounds(64, 16, std::nullopt);

  EXPECT_FALSE(h.apply(clamp, SafetyLevel::Strict));
  EXPECT_FALSE(h.apply(clamp, SafetyLevel::Off));
  EXPECT_FALSE(h.apply(HealingAction{}, SafetyLevel::Hardened));
  EXPECT_TRUE(h.apply(clamp, SafetyLevel::Hardened));
  EXPECT_TRUE(h.apply(h.safe_default(), SafetyLevel::Hardened));
  EXPECT_TRUE(h.apply(h.realloc_as_malloc(8), SafetyLevel::Hardened));

  auto s = h.summary();
  EXPECT_EQ(s.suppressed, 2u);
  EXPECT_EQ(s.total_heals, 3u);
  EXPECT_EQ(s.size_clamps, 1u);
  EXPECT_EQ(s.safe_defaults, 1u);
  EXPECT_EQ(s.realloc_as_mallocs, 1u);

  h.reset_for_tests();
  s = h.summary();
  EXPECT_EQ(s.total_heals, 0u);
  EXPECT_EQ(s.suppressed, 0u);
  EXPECT_EQ(msm::pipeline::to_string(HealKind::ClampSize), "clamp_size");
}
