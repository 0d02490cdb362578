// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <string>

#include "msm/monitors/ensemble.h"

using msm::control::Probe;
using msm::control::probe_bit;
using msm::monitors::Ensemble;
using msm::monitors::Level;
using msm::monitors::SeverityVector;

namespace {

SeverityVector filled(std::uint8_t s) {
  SeverityVector v{};
  v.fill(s);
  return v;
}

} // namespace

TEST(EnsembleTest, MembersAndGroups) {
  Ensemble e;
  EXPECT_EQ(e.size(), 27u);
  std::set<std::string> names;
  for (std::size_t i = 0; i < e.size(); ++i) names.insert(std::string(e.member(i).name()));
  EXPECT_EQ(names.size(), e.size());
  EXPECT_EQ(e.worst_level(), Level::Calibrating);
  EXPECT_TRUE(e.any_calibrating());
  EXPECT_THROW(e.member(e.size()), std::out_of_range);
}

TEST(EnsembleTest, QuietInputCalibratesToNominal) {
  Ensemble e;
  for (int i = 0; i < 400; ++i) e.observe(SeverityVector{});
  EXPECT_FALSE(e.any_calibrating());
  EXPECT_EQ(e.worst_level(), Level::Nominal);
  EXPECT_EQ(e.count_at_least(Level::Warning), 0u);
  for (std::uint8_t l : e.fusion_levels()) EXPECT_EQ(l, 0);
  EXPECT_EQ(e.observations(), 400u);
  EXPECT_GE(e.transitions(), e.size());
}

TEST(EnsembleTest, OffPlanMembersUpdateOnCadence) {
  Ensemble e;
  const std::uint32_t mask = probe_bit(Probe::Martingale);
  std::size_t martingale_members = 0;
  for (std::size_t i = 0; i < e.size(); ++i) {
    if (e.probe_of(i) == Probe::Martingale) ++martingale_members;
  }
  ASSERT_EQ(martingale_members, 3u);
  for (std::uint64_t t = 1; t < Ensemble::kOffPlanCadence; ++t) {
    EXPECT_EQ(e.observe(SeverityVector{}, mask), martingale_members);
  }
  EXPECT_EQ(e.observe(SeverityVector{}, mask), e.size());
  for (std::size_t i = 0; i < e.size(); ++i) {
    const std::uint64_t want = e.probe_of(i) == Probe::Martingale ? Ensemble::kOffPlanCadence : 1;
    EXPECT_EQ(e.member(i).observations(), want) << e.member(i).name();
  }
}

TEST(EnsembleTest, SaturationRaisesGroupsAndFusionCodes) {
  Ensemble e;
  for (int i = 0; i < 400; ++i) e.observe(SeverityVector{});
  for (int i = 0; i < 300; ++i) e.observe(filled(3));
  EXPECT_EQ(e.worst_level(), Level::Critical);
  EXPECT_TRUE(e.group_anomalous(Probe::Renewal));
  EXPECT_TRUE(e.group_anomalous(Probe::Localization));
  EXPECT_GT(e.count_at_least(Level::Critical), 0u);
  bool saw_three = false;
  for (std::uint8_t l : e.fusion_levels()) saw_three = saw_three || l == 3;
  EXPECT_TRUE(saw_three);
  EXPECT_EQ(e.summaries().size(), e.size());
}
