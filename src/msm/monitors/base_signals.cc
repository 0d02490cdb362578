// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/monitors/base_signals.h"

#include <limits>

namespace msm { namespace monitors {

namespace {

constexpr double kNever = std::numeric_limits<double>::infinity();

// Latencies in ns, stage cost in ns of lookup stages, contention in
// concurrent frees, everything else a fraction of events.
constexpr std::array<SignalThresholds, kNumSignals> kThresholds = {{
    {2000.0, 20000.0, 100000.0},  // ValidateLatency
    {0.30, 0.60, 0.90},           // FullProfileRate
    {0.50, kNever, kNever},       // ForeignRate
    {0.001, 0.01, 0.05},          // TemporalRate
    {0.50, kNever, kNever},       // NullRate
    {0.60, kNever, kNever},       // CacheMissRate
    {0.50, kNever, kNever},       // BloomRejectRate
    {0.01, 0.05, 0.20},           // PageOracleDisagreement
    {0.05, 0.20, 0.50},           // ArenaMissRate
    {5000.0, 50000.0, 500000.0},  // FreeLatency
    {0.001, 0.01, 0.05},          // DoubleFree
    {0.001, 0.01, 0.05},          // ForeignFree
    {0.001, 0.01, 0.05},          // InvalidFree
    {0.001, 0.01, 0.05},          // CanaryCorruption
    {0.05, 0.25, 0.50},           // QuarantineBytePressure
    {0.25, 0.50, 1.00},           // QuarantineDepthPressure
    {0.01, 0.05, 0.20},           // AllocFailure
    {4.0, 8.0, 16.0},             // FreeContention
    {0.05, 0.15, 0.30},           // RiskUpperBound
    {30.0, kNever, kNever},       // StageCost
    {0.10, 0.30, 0.60},           // ProbeAnomalyRate
    {0.10, 0.30, 0.60},           // LargeAllocRate
    {0.50, kNever, kNever},       // InteriorPointerRate
    {0.001, 0.01, 0.05},          // FingerprintMismatch
    {0.10, 0.30, 0.60},           // EvictionRate
}};

} // namespace

std::string_view to_string(Signal s) noexcept {
  switch (s) {
    case Signal::ValidateLatency: return "validate_latency";
    case Signal::FullProfileRate: return "full_profile_rate";
    case Signal::ForeignRate: return "foreign_rate";
    case Signal::TemporalRate: return "temporal_rate";
    case Signal::NullRate: return "null_rate";
    case Signal::CacheMissRate: return "cache_miss_rate";
    case Signal::BloomRejectRate: return "bloom_reject_rate";
    case Signal::PageOracleDisagreement: return "page_oracle_disagreement";
    case Signal::ArenaMissRate: return "arena_miss_rate";
    case Signal::FreeLatency: return "free_latency";
    case Signal::DoubleFree: return "double_free";
    case Signal::ForeignFree: return "foreign_free";
    case Signal::InvalidFree: return "invalid_free";
    case Signal::CanaryCorruption: return "canary_corruption";
    case Signal::QuarantineBytePressure: return "quarantine_byte_pressure";
    case Signal::QuarantineDepthPressure: return "quarantine_depth_pressure";
    case Signal::AllocFailure: return "alloc_failure";
    case Signal::FreeContention: return "free_contention";
    case Signal::RiskUpperBound: return "risk_upper_bound";
    case Signal::StageCost: return "stage_cost";
    case Signal::ProbeAnomalyRate: return "probe_anomaly_rate";
    case Signal::LargeAllocRate: return "large_alloc_rate";
    case Signal::InteriorPointerRate: return "interior_pointer_rate";
    case Signal::FingerprintMismatch: return "fingerprint_mismatch";
    case Signal::EvictionRate: return "eviction_rate";
  }
  return "unknown";
}

const SignalThresholds& BaseSignals::thresholds(Signal s) noexcept {
  return kThresholds[static_cast<std::size_t>(s)];
}

std::uint8_t BaseSignals::classify(double value, const SignalThresholds& t) noexcept {
  if (value >= t.critical) return 3;
  if (value >= t.warning) return 2;
  if (value >= t.elevated) return 1;
  return 0;
}

void BaseSignals::record(Signal s, double value) noexcept {
  const std::size_t i = static_cast<std::size_t>(s);
  const std::uint64_t n = ++samples_[i];
  // Plain mean over the first few samples so a channel starts from data.
  const double a = n < 20 ? 1.0 / static_cast<double>(n) : kAlpha;
  ewma_[i] += a * (value - ewma_[i]);
}

std::uint8_t BaseSignals::severity(Signal s) const noexcept {
  return classify(value(s), thresholds(s));
}

SeverityVector BaseSignals::snapshot() const noexcept {
  SeverityVector v{};
  for (std::size_t i = 0; i < kNumSignals; ++i) v[i] = severity(static_cast<Signal>(i));
  return v;
}

}} // namespace msm::monitors
