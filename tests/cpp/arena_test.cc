// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <cstdint>
#include <cstring>
#include <vector>

#include "msm/arena/arena.h"
#include "msm/arena/fingerprint.h"
#include "msm/core/config.h"

using msm::arena::Arena;
using msm::arena::FreeReport;
using msm::arena::FreeResult;
using msm::core::SafetyState;

namespace {

msm::core::MembraneConfig small_quarantine() {
  msm::core::MembraneConfig cfg;
  cfg.quarantine_max_entries = 16;  // one entry per shard
  cfg.quarantine_max_bytes = 1u << 20;
  return cfg;
}

std::uintptr_t addr_of(const void* p) { return reinterpret_cast<std::uintptr_t>(p); }

} // namespace

TEST(ArenaTest, AllocateLookupFree) {
  Arena a;
  void* p = a.allocate(100);
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(addr_of(p) % Arena::kMinAlign, 0u);
  std::memset(p, 0xab, 100);

  auto s = a.lookup(addr_of(p));
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->user_base, addr_of(p));
  EXPECT_EQ(s->user_size, 100u);
  EXPECT_EQ(s->state, SafetyState::Valid);
  EXPECT_TRUE(msm::arena::verify_header(s->user_base, s->user_size, s->generation));

  auto interior = a.lookup(addr_of(p) + 99);
  ASSERT_TRUE(interior.has_value());
  EXPECT_EQ(interior->user_base, addr_of(p));
  EXPECT_FALSE(a.lookup(addr_of(p) + 100).has_value());

  const FreeReport r = a.free(p);
  EXPECT_EQ(r.result, FreeResult::Freed);
  EXPECT_EQ(r.user_size, 100u);
  EXPECT_GT(r.generation, s->generation);
  auto q = a.lookup(addr_of(p));
  ASSERT_TRUE(q.has_value());
  EXPECT_EQ(q->state, SafetyState::Quarantined);
}

TEST(ArenaTest, ZeroSizeAndAlignment) {
  Arena a;
  void* z = a.allocate(0);
  ASSERT_NE(z, nullptr);
  EXPECT_EQ(a.lookup(addr_of(z))->user_size, 1u);

  void* p = a.allocate_aligned(40, 256);
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(addr_of(p) % 256, 0u);
  EXPECT_EQ(a.allocate_aligned(40, 48), nullptr);
  EXPECT_EQ(a.allocate(SIZE_MAX - 8), nullptr);
  EXPECT_EQ(a.stats().alloc_failures, 2u);
  EXPECT_EQ(a.free(z).result, FreeResult::Freed);
  EXPECT_EQ(a.free(p).result, FreeResult::Freed);
}

TEST(ArenaTest, DoubleForeignAndInteriorFrees) {
  Arena a;
  void* p = a.allocate(64);
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(a.free(static_cast<char*>(p) + 8).result, FreeResult::InvalidPointer);
  EXPECT_EQ(a.free(p).result, FreeResult::Freed);
  EXPECT_EQ(a.free(p).result, FreeResult::DoubleFree);

  int on_stack = 0;
  EXPECT_EQ(a.free(&on_stack).result, FreeResult::ForeignPointer);
  EXPECT_EQ(a.free(nullptr).result, FreeResult::ForeignPointer);

  const auto st = a.stats();
  EXPECT_EQ(st.double_frees, 1u);
  EXPECT_EQ(st.invalid_frees, 1u);
  EXPECT_EQ(st.foreign_frees, 2u);
}

TEST(ArenaTest, CanaryCorruptionOnSmallAllocation) {
  Arena a;
  std::uint64_t expected = 0;
  // Each single byte of the 8-byte canary.
  for (std::size_t off = 32; off < 40; ++off) {
    void* p = a.allocate(32);
    ASSERT_NE(p, nullptr);
    auto* b = static_cast<unsigned char*>(p);
    b[off] = static_cast<unsigned char>(b[off] ^ 0xFF);
    EXPECT_EQ(a.free(p).result, FreeResult::FreedWithCanaryCorruption) << "offset " << off;
    EXPECT_EQ(a.stats().canary_failures, ++expected);
  }
  // Overruns of 1..8 bytes starting right past the end.
  for (std::size_t len = 1; len <= 8; ++len) {
    void* p = a.allocate(32);
    ASSERT_NE(p, nullptr);
    auto* b = static_cast<unsigned char*>(p);
    for (std::size_t i = 0; i < len; ++i) b[32 + i] = static_cast<unsigned char>(b[32 + i] ^ 0x5A);
    EXPECT_EQ(a.free(p).result, FreeResult::FreedWithCanaryCorruption) << "length " << len;
    EXPECT_EQ(a.stats().canary_failures, ++expected);
  }
  // Writes inside the user region leave the canary intact.
  void* p = a.allocate(32);
  ASSERT_NE(p, nullptr);
  std::memset(p, 0xAB, 32);
  EXPECT_EQ(a.free(p).result, FreeResult::Freed);
  EXPECT_EQ(a.stats().canary_failures, expected);
}

TEST(ArenaTest, VerifyIntegrityFollowsBlockLifetime) {
  Arena a;
  void* p = a.allocate(48);
  ASSERT_NE(p, nullptr);
  auto s = a.lookup(addr_of(p));
  ASSERT_TRUE(s.has_value());

  auto r = a.verify_integrity(s->user_base, s->generation);
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->header_ok);
  EXPECT_TRUE(r->canary_ok);

  EXPECT_FALSE(a.verify_integrity(s->user_base, s->generation + 1).has_value());
  EXPECT_FALSE(a.verify_integrity(s->user_base + 8, s->generation).has_value());
  EXPECT_FALSE(a.verify_integrity(0, s->generation).has_value());

  auto* b = static_cast<unsigned char*>(p);
  b[48] = static_cast<unsigned char>(b[48] ^ 0xFF);
  r = a.verify_integrity(s->user_base, s->generation);
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(r->header_ok);
  EXPECT_FALSE(r->canary_ok);

  EXPECT_EQ(a.free(p).result, FreeResult::FreedWithCanaryCorruption);
  EXPECT_FALSE(a.verify_integrity(s->user_base, s->generation).has_value());
}

TEST(ArenaTest, GenerationsStrictlyIncrease) {
  Arena a;
  std::uint32_t last = 0;
  for (int i = 0; i < 64; ++i) {
    void* p = a.allocate(16 + i);
    ASSERT_NE(p, nullptr);
    const std::uint32_t g = a.lookup(addr_of(p))->generation;
    EXPECT_GT(g, last);
    const FreeReport r = a.free(p);
    EXPECT_GT(r.generation, g);
    last = r.generation;
  }
}

TEST(ArenaTest, QuarantineStaysWithinBounds) {
  Arena a(small_quarantine());
  std::vector<void*> ptrs;
  for (int i = 0; i < 512; ++i) {
    void* p = a.allocate(128);
    ASSERT_NE(p, nullptr);
    ptrs.push_back(p);
  }
  std::size_t drained = 0;
  for (void* p : ptrs) {
    const FreeReport r = a.free(p);
    EXPECT_EQ(r.result, FreeResult::Freed);
    drained += r.drained.size();
    const auto st = a.stats();
    EXPECT_LE(st.quarantined_entries, Arena::kNumShards);
    EXPECT_LE(st.quarantined_bytes, a.quarantine_byte_cap());
  }
  const auto st = a.stats();
  EXPECT_EQ(drained, st.evictions);
  EXPECT_EQ(st.quarantined_entries + st.evictions, ptrs.size());
  EXPECT_EQ(st.live_allocations, 0u);
}

TEST(ArenaTest, DoubleFreeAfterEvictionStillDetected) {
  Arena a(small_quarantine());
  void* victim = a.allocate(64);
  ASSERT_NE(victim, nullptr);
  ASSERT_EQ(a.free(victim).result, FreeResult::Freed);
  // Push the victim out of its shard's quarantine.
  const std::size_t shard = Arena::shard_index(addr_of(victim));
  bool evicted = false;
  for (int i = 0; i < 4096 && !evicted; ++i) {
    void* p = a.allocate(64);
    ASSERT_NE(p, nullptr);
    const bool same_shard = Arena::shard_index(addr_of(p)) == shard;
    const FreeReport r = a.free(p);
    if (!same_shard) continue;
    for (const auto& e : r.drained) {
      if (e.user_base == addr_of(victim)) evicted = true;
    }
  }
  if (!evicted) GTEST_SKIP() << "system allocator never placed a block in the victim's shard";
  if (a.lookup(addr_of(victim)).has_value()) GTEST_SKIP() << "victim address was reused";
  EXPECT_EQ(a.free(victim).result, FreeResult::DoubleFree);
}

TEST(ArenaTest, RemainingFromInteriorPointer) {
  Arena a;
  void* p = a.allocate(200);
  ASSERT_NE(p, nullptr);
  auto r = a.remaining_from(addr_of(p) + 50);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->second, 150u);
  EXPECT_EQ(r->first.user_base, addr_of(p));
  EXPECT_FALSE(a.remaining_from(0).has_value());
  EXPECT_EQ(a.free(p).result, FreeResult::Freed);
}

TEST(ArenaTest, AdaptiveDepthCapsEntries) {
  msm::core::MembraneConfig cfg;
  cfg.quarantine_max_entries = 4096;
  Arena a(cfg);
  EXPECT_EQ(a.quarantine_entry_cap(), 4096u);
  a.set_quarantine_depth(64);
  EXPECT_EQ(a.quarantine_entry_cap(), 64u);
  a.set_quarantine_depth(1u << 20);
  EXPECT_EQ(a.quarantine_entry_cap(), 4096u);

  cfg.adaptive_quarantine = false;
  Arena fixed(cfg);
  fixed.set_quarantine_depth(64);
  EXPECT_EQ(fixed.quarantine_entry_cap(), 4096u);
}
