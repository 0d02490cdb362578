// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>

#include "msm/arena/arena.h"
#include "msm/pipeline/outcome.h"

namespace msm { namespace pipeline {

// Process-wide counters across all pipeline instances.
struct MembraneStats {
  std::atomic<std::uint64_t> validations{0};
  std::atomic<std::uint64_t> null_outcomes{0};
  std::atomic<std::uint64_t> cached_outcomes{0};
  std::atomic<std::uint64_t> validated_outcomes{0};
  std::atomic<std::uint64_t> foreign_outcomes{0};
  std::atomic<std::uint64_t> temporal_violations{0};
  std::atomic<std::uint64_t> bypassed_outcomes{0};

  std::atomic<std::uint64_t> fast_profile{0};
  std::atomic<std::uint64_t> full_profile{0};
  std::atomic<std::uint64_t> bloom_rejects{0};
  std::atomic<std::uint64_t> page_oracle_rescues{0};
  std::atomic<std::uint64_t> fingerprint_mismatches{0};
  std::atomic<std::uint64_t> canary_mismatches{0};

  // Every allocate call; failures are a subset.
  std::atomic<std::uint64_t> allocations{0};
  std::atomic<std::uint64_t> allocation_failures{0};
  std::atomic<std::uint64_t> registrations{0};

  // Every free call whatever its result; the per-result counters below
  // break it down. Plain releases are frees minus the rejected ones.
  std::atomic<std::uint64_t> frees{0};
  std::atomic<std::uint64_t> double_frees{0};
  std::atomic<std::uint64_t> foreign_frees{0};
  std::atomic<std::uint64_t> invalid_frees{0};
  std::atomic<std::uint64_t> canary_corrupt_frees{0};
};

const MembraneStats& get_membrane_stats() noexcept;

// Test-only helper to zero all counters. Intended for serial test suites.
void reset_membrane_stats_for_tests() noexcept;

namespace detail {

// All increments are memory_order_relaxed.
void record_outcome(OutcomeKind k) noexcept;
void record_profile(bool full) noexcept;
void record_bloom_reject(bool rescued_by_page_oracle) noexcept;
void record_integrity_mismatch(bool fingerprint, bool canary) noexcept;
void record_allocation(bool ok) noexcept;
void record_registration() noexcept;
void record_free(arena::FreeResult r) noexcept;

} // namespace detail

}} // namespace msm::pipeline
