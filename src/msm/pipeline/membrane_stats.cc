// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/pipeline/membrane_stats.h"

namespace msm { namespace pipeline {

namespace {

MembraneStats g_stats;

inline void bump(std::atomic<std::uint64_t>& c) noexcept { c.fetch_add(1, std::memory_order_relaxed); }
inline void zero(std::atomic<std::uint64_t>& c) noexcept { c.store(0, std::memory_order_relaxed); }

} // namespace

std::string_view to_string(OutcomeKind k) noexcept {
  switch (k) {
    case OutcomeKind::Null: return "null";
    case OutcomeKind::CachedValid: return "cached_valid";
    case OutcomeKind::Validated: return "validated";
    case OutcomeKind::Foreign: return "foreign";
    case OutcomeKind::TemporalViolation: return "temporal_violation";
    case OutcomeKind::Bypassed: return "bypassed";
  }
  return "unknown";
}

const MembraneStats& get_membrane_stats() noexcept { return g_stats; }

void reset_membrane_stats_for_tests() noexcept {
  zero(g_stats.validations);
  zero(g_stats.null_outcomes);
  zero(g_stats.cached_outcomes);
  zero(g_stats.validated_outcomes);
  zero(g_stats.foreign_outcomes);
  zero(g_stats.temporal_violations);
  zero(g_stats.bypassed_outcomes);
  zero(g_stats.fast_profile);
  zero(g_stats.full_profile);
  zero(g_stats.bloom_rejects);
  zero(g_stats.page_oracle_rescues);
  zero(g_stats.fingerprint_mismatches);
  zero(g_stats.canary_mismatches);
  zero(g_stats.allocations);
  zero(g_stats.allocation_failures);
  zero(g_stats.registrations);
  zero(g_stats.frees);
  zero(g_stats.double_frees);
  zero(g_stats.foreign_frees);
  zero(g_stats.invalid_frees);
  zero(g_stats.canary_corrupt_frees);
}

namespace detail {

void record_outcome(OutcomeKind k) noexcept {
  bump(g_stats.validations);
  switch (k) {
    case OutcomeKind::Null: bump(g_stats.null_outcomes); break;
    case OutcomeKind::CachedValid: bump(g_stats.cached_outcomes); break;
    case OutcomeKind::Validated: bump(g_stats.validated_outcomes); break;
    case OutcomeKind::Foreign: bump(g_stats.foreign_outcomes); break;
    case OutcomeKind::TemporalViolation: bump(g_stats.temporal_violations); break;
    case OutcomeKind::Bypassed: bump(g_stats.bypassed_outcomes); break;
  }
}

void record_profile(bool full) noexcept { bump(full ? g_stats.full_profile : g_stats.fast_profile); }

void record_bloom_reject(bool rescued_by_page_oracle) noexcept {
  bump(g_stats.bloom_rejects);
  if (rescued_by_page_oracle) bump(g_stats.page_oracle_rescues);
}

void record_integrity_mismatch(bool fingerprint, bool canary) noexcept {
  if (fingerprint) bump(g_stats.fingerprint_mismatches);
  if (canary) bump(g_stats.canary_mismatches);
}

void record_allocation(bool ok) noexcept {
  bump(g_stats.allocations);
  if (!ok) bump(g_stats.allocation_failures);
}

void record_registration() noexcept { bump(g_stats.registrations); }

void record_free(arena::FreeResult r) noexcept {
  bump(g_stats.frees);
  switch (r) {
    case arena::FreeResult::Freed: break;
    case arena::FreeResult::FreedWithCanaryCorruption: bump(g_stats.canary_corrupt_frees); break;
    case arena::FreeResult::DoubleFree: bump(g_stats.double_frees); break;
    case arena::FreeResult::ForeignPointer: bump(g_stats.foreign_frees); break;
    case arena::FreeResult::InvalidPointer: bump(g_stats.invalid_frees); break;
  }
}

} // namespace detail

}} // namespace msm::pipeline
