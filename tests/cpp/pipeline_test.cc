// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <initializer_list>
#include <cstdint>
#include <vector>

#include "msm/control/runtime_kernel.h"
#include "msm/control/stage_oracle.h"
#include "msm/core/safety_level.h"
#include "msm/pipeline/membrane_stats.h"
#include "msm/pipeline/pipeline.h"

using msm::arena::FreeResult;
using msm::control::Profile;
using msm::control::RuntimeKernel;
using msm::core::MembraneConfig;
using msm::core::SafetyLevel;
using msm::core::SafetyState;
using msm::pipeline::OutcomeKind;
using msm::pipeline::ValidationOutcome;
using msm::pipeline::ValidationPipeline;

namespace {

struct SafetyLevelGuard {
  SafetyLevel prev;
  explicit SafetyLevelGuard(SafetyLevel l) : prev(msm::core::safety_level()) { msm::core::set_safety_level(l); }
  ~SafetyLevelGuard() { msm::core::set_safety_level(prev); }
};

struct StatsReset {
  StatsReset() { msm::pipeline::reset_membrane_stats_for_tests(); }
  ~StatsReset() { msm::pipeline::reset_membrane_stats_for_tests(); }
};

unsigned char* bytes(void* p) { return static_cast<unsigned char*>(p); }

// Feeds clean cache hits until every monitor has left calibration.
void settle_on_fast(ValidationPipeline& p) {
  msm::control::ValidationEvent e;
  e.profile = Profile::Fast;
  e.elapsed_ns = 40;
  e.lookup_cost_ns = 5;
  e.cache_hit = true;
  for (std::uint64_t i = 0; i < 400 * RuntimeKernel::kMetaCadence; ++i) p.kernel().observe_validation(e);
}

} // namespace

TEST(PipelineTest, AllocateValidateFree) {
  SafetyLevelGuard g(SafetyLevel::Strict);
  ValidationPipeline p;
  void* a = p.allocate(64);
  ASSERT_NE(a, nullptr);

  ValidationOutcome v = p.validate(a);
  EXPECT_EQ(v.kind, OutcomeKind::Validated);
  EXPECT_TRUE(v.can_read());
  EXPECT_TRUE(v.can_write());
  ASSERT_TRUE(v.abs.alloc_base.has_value());
  EXPECT_EQ(*v.abs.alloc_base, reinterpret_cast<std::uintptr_t>(a));
  EXPECT_EQ(v.abs.remaining.value_or(0), 64u);
  EXPECT_TRUE(v.abs.generation.has_value());

  // Same address, no intervening free.
  v = p.validate(a);
  EXPECT_EQ(v.kind, OutcomeKind::CachedValid);
  EXPECT_EQ(v.abs.remaining.value_or(0), 64u);

  // Interior pointer; a fresh pipeline is still calibrating and runs full depth.
  v = p.validate(bytes(a) + 10);
  EXPECT_TRUE(v.is_valid());
  EXPECT_EQ(v.abs.remaining.value_or(0), 54u);

  const std::uint64_t epoch = p.epoch();
  EXPECT_EQ(p.free(a), FreeResult::Freed);
  EXPECT_GT(p.epoch(), epoch);

  v = p.validate(a);
  EXPECT_EQ(v.kind, OutcomeKind::TemporalViolation);
  EXPECT_FALSE(v.can_read());
  EXPECT_FALSE(v.can_write());
  EXPECT_EQ(v.abs.state, SafetyState::Quarantined);
}

TEST(PipelineTest, NullAndForeign) {
  SafetyLevelGuard g(SafetyLevel::Strict);
  StatsReset r;
  ValidationPipeline p;

  ValidationOutcome v = p.validate(std::uintptr_t{0});
  EXPECT_EQ(v.kind, OutcomeKind::Null);
  EXPECT_FALSE(v.can_read());

  int on_stack = 0;
  v = p.validate(&on_stack);
  EXPECT_EQ(v.kind, OutcomeKind::Foreign);
  EXPECT_TRUE(v.can_read());
  EXPECT_FALSE(v.is_valid());

  const auto& s = msm::pipeline::get_membrane_stats();
  EXPECT_EQ(s.null_outcomes.load(), 1u);
  EXPECT_EQ(s.foreign_outcomes.load(), 1u);
  EXPECT_EQ(s.validations.load(), 2u);
}

TEST(PipelineTest, OffBypassesValidation) {
  SafetyLevelGuard g(SafetyLevel::Off);
  ValidationPipeline p;
  void* a = p.allocate(16);
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(p.validate(a).kind, OutcomeKind::Bypassed);
  EXPECT_EQ(p.validate(std::uintptr_t{0}).kind, OutcomeKind::Bypassed);
  EXPECT_TRUE(p.validate(std::uintptr_t{0}).can_read());
  EXPECT_EQ(p.free(a), FreeResult::Freed);
}

TEST(PipelineTest, DoubleFreeIsDetectedAndHealedWhenHardened) {
  ValidationPipeline p;
  {
    SafetyLevelGuard g(SafetyLevel::Strict);
    void* a = p.allocate(48);
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(p.free(a), FreeResult::Freed);
    EXPECT_EQ(p.free(a), FreeResult::DoubleFree);
    EXPECT_EQ(p.healing().summary().ignored_double_frees, 0u);
    EXPECT_EQ(p.healing().summary().suppressed, 1u);
  }
  {
    SafetyLevelGuard g(SafetyLevel::Hardened);
    void* b = p.allocate(48);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(p.free(b), FreeResult::Freed);
    EXPECT_EQ(p.free(b), FreeResult::DoubleFree);
    int local = 0;
    EXPECT_EQ(p.free(&local), FreeResult::ForeignPointer);
    const auto h = p.healing().summary();
    EXPECT_EQ(h.ignored_double_frees, 1u);
    EXPECT_EQ(h.ignored_foreign_frees, 1u);
  }
  EXPECT_EQ(p.arena().stats().double_frees, 2u);
  EXPECT_GE(p.quarantine_controller().summary().total_detections, 2u);
}

TEST(PipelineTest, CanaryCorruptionSeenByFullValidationAndFree) {
  SafetyLevelGuard g(SafetyLevel::Strict);
  StatsReset r;
  ValidationPipeline p;
  void* a = p.allocate(32);
  ASSERT_NE(a, nullptr);
  bytes(a)[32] = 0x41;

  ASSERT_TRUE(p.kernel().calibrating());
  const ValidationOutcome v = p.validate(a);
  EXPECT_EQ(v.kind, OutcomeKind::Validated);
  const auto& s = msm::pipeline::get_membrane_stats();
  EXPECT_EQ(s.canary_mismatches.load(), 1u);
  EXPECT_EQ(s.fingerprint_mismatches.load(), 0u);

  EXPECT_EQ(p.free(a), FreeResult::FreedWithCanaryCorruption);
  EXPECT_EQ(s.canary_corrupt_frees.load(), 1u);
}

TEST(PipelineTest, GenerationsIncreaseAcrossAllocations) {
  SafetyLevelGuard g(SafetyLevel::Strict);
  ValidationPipeline p;
  std::uint32_t last = 0;
  for (int i = 0; i < 128; ++i) {
    void* a = p.allocate(24);
    ASSERT_NE(a, nullptr);
    const ValidationOutcome v = p.validate(a);
    ASSERT_TRUE(v.abs.generation.has_value());
    EXPECT_GT(*v.abs.generation, last);
    last = *v.abs.generation;
    EXPECT_EQ(p.free(a), FreeResult::Freed);
  }
}

TEST(PipelineTest, QuarantineStaysWithinCaps) {
  SafetyLevelGuard g(SafetyLevel::Strict);
  MembraneConfig cfg;
  cfg.quarantine_max_entries = 16;
  cfg.quarantine_max_bytes = 4096;
  ValidationPipeline p(cfg);

  std::vector<void*> blocks;
  for (int i = 0; i < 256; ++i) {
    void* a = p.allocate(64);
    ASSERT_NE(a, nullptr);
    blocks.push_back(a);
  }
  for (void* a : blocks) {
    EXPECT_EQ(p.free(a), FreeResult::Freed);
    const auto st = p.arena().stats();
    EXPECT_LE(st.quarantined_entries, p.arena().quarantine_entry_cap());
    EXPECT_LE(st.quarantined_bytes, p.arena().quarantine_byte_cap());
  }
  const auto st = p.arena().stats();
  EXPECT_GT(st.evictions, 0u);
  EXPECT_EQ(st.live_allocations, 0u);
  EXPECT_EQ(st.total_frees, 256u);
}

TEST(PipelineTest, RegisteredRangesPassPreFilters) {
  SafetyLevelGuard g(SafetyLevel::Strict);
  StatsReset r;
  ValidationPipeline p;
  std::vector<unsigned char> buf(256);
  const auto base = reinterpret_cast<std::uintptr_t>(buf.data());

  p.register_allocation(0, 64);
  p.register_allocation(base, buf.size());
  EXPECT_TRUE(p.bloom().might_contain(base));
  EXPECT_TRUE(p.page_oracle().query(base));
  EXPECT_EQ(msm::pipeline::get_membrane_stats().registrations.load(), 1u);

  // Known to the pre-filters but not owned by the arena.
  const ValidationOutcome v = p.validate(base);
  EXPECT_EQ(v.kind, OutcomeKind::Foreign);
  EXPECT_TRUE(v.can_write());
}

TEST(PipelineTest, CopyLengthClampsOnlyWhenHardened) {
  ValidationPipeline p;
  void* dst = p.allocate(16);
  void* src = p.allocate(64);
  ASSERT_NE(dst, nullptr);
  ASSERT_NE(src, nullptr);
  {
    SafetyLevelGuard g(SafetyLevel::Strict);
    EXPECT_EQ(p.copy_length(dst, src, 64), 64u);
    EXPECT_EQ(p.healing().summary().suppressed, 1u);
  }
  {
    SafetyLevelGuard g(SafetyLevel::Hardened);
    EXPECT_EQ(p.copy_length(dst, src, 64), 16u);
    EXPECT_EQ(p.copy_length(dst, src, 8), 8u);
    EXPECT_EQ(p.string_length(dst, 40), 15u);
    EXPECT_EQ(p.string_length(dst, 3), 3u);
    int local[4] = {};
    EXPECT_EQ(p.copy_length(local, local, 1000), 1000u);
    const auto h = p.healing().summary();
    EXPECT_EQ(h.size_clamps, 1u);
    EXPECT_EQ(h.null_truncations, 1u);
  }
  EXPECT_EQ(p.free(dst), FreeResult::Freed);
  EXPECT_EQ(p.free(src), FreeResult::Freed);
}

TEST(PipelineTest, HardenedKeepsDeepChecksOnFastProfile) {
  StatsReset r;
  ValidationPipeline p;
  void* dst = p.allocate(64);
  void* src = p.allocate(128);
  void* bad = p.allocate(32);
  ASSERT_NE(dst, nullptr);
  ASSERT_NE(src, nullptr);
  ASSERT_NE(bad, nullptr);
  bytes(bad)[32] = static_cast<unsigned char>(bytes(bad)[32] ^ 0xFF);

  settle_on_fast(p);
  ASSERT_FALSE(p.kernel().calibrating());
  const auto& s = msm::pipeline::get_membrane_stats();
  {
    SafetyLevelGuard g(SafetyLevel::Hardened);
    // Interior pointers are never in the bloom; only the page rescue finds them.
    ASSERT_EQ(p.kernel().decide(msm::core::ApiFamily::PointerValidation, SafetyLevel::Hardened).profile,
              Profile::Fast);
    const std::uint64_t fast_before = s.fast_profile.load();

    const ValidationOutcome v = p.validate(bytes(dst) + 32);
    EXPECT_EQ(v.kind, OutcomeKind::Validated);
    ASSERT_TRUE(v.abs.alloc_base.has_value());
    EXPECT_EQ(*v.abs.alloc_base, reinterpret_cast<std::uintptr_t>(dst));
    EXPECT_EQ(v.abs.remaining.value_or(0), 32u);
    EXPECT_GT(s.fast_profile.load(), fast_before);

    EXPECT_EQ(p.copy_length(bytes(dst) + 32, src, 100), 32u);
    EXPECT_EQ(p.healing().summary().size_clamps, 1u);

    EXPECT_EQ(p.validate(bad).kind, OutcomeKind::Validated);
    EXPECT_EQ(s.canary_mismatches.load(), 1u);
  }
  EXPECT_EQ(p.free(dst), FreeResult::Freed);
  EXPECT_EQ(p.free(src), FreeResult::Freed);
  EXPECT_EQ(p.free(bad), FreeResult::FreedWithCanaryCorruption);
}

TEST(PipelineTest, PublishedStageOrdersStayComplete) {
  SafetyLevelGuard g(SafetyLevel::Strict);
  ValidationPipeline p;
  std::vector<void*> blocks;
  for (int i = 0; i < 64; ++i) blocks.push_back(p.allocate(40));
  int local = 0;
  for (int round = 0; round < 40; ++round) {
    for (void* a : blocks) (void)p.validate(bytes(a) + (round % 3));
    (void)p.validate(&local);
    (void)p.validate(std::uintptr_t{0}, msm::core::ApiFamily::StringMemory);
  }
  for (std::uint8_t fam = 0; fam < msm::core::kNumApiFamilies; ++fam) {
    for (bool aligned : {false, true}) {
      const auto order = p.stage_oracle().order_for(fam, aligned);
      EXPECT_TRUE(msm::control::is_permutation_of_all_stages(order));
      EXPECT_EQ(msm::control::dependency_safe(order)[0], msm::control::Stage::Null);
    }
  }
  EXPECT_GT(p.stage_oracle().summary().calls, 0u);
  for (void* a : blocks) EXPECT_EQ(p.free(a), FreeResult::Freed);
}

TEST(PipelineTest, OwnersAreDistinct) {
  ValidationPipeline a;
  ValidationPipeline b;
  EXPECT_NE(a.owner_id(), b.owner_id());
  EXPECT_EQ(&ValidationPipeline::get(), &ValidationPipeline::get());
}
