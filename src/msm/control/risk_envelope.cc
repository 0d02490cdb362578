// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/control/risk_envelope.h"

#include <algorithm>
#include <cmath>

namespace msm { namespace control {

RiskEnvelope::RiskEnvelope(std::uint32_t prior_ppm, double z) : z_(z) {
  for (auto& c : cached_ub_ppm_) c.store(prior_ppm, std::memory_order_relaxed);
}

std::uint32_t RiskEnvelope::compute_upper_bound_ppm(std::uint64_t calls, std::uint64_t adverse, double z) noexcept {
  const double n = static_cast<double>(calls);
  const double p = (static_cast<double>(adverse) + 1.0) / (n + 2.0);
  const double var = std::max(p * (1.0 - p) / (n + 3.0), 0.0);
  const double ub = std::clamp(p + z * std::sqrt(var), 0.0, 1.0);
  return static_cast<std::uint32_t>(std::round(ub * 1e6));
}

void RiskEnvelope::observe(core::ApiFamily family, bool adverse) noexcept {
  const std::size_t i = core::family_index(family);
  const std::uint64_t n = calls_[i].fetch_add(1, std::memory_order_relaxed) + 1;
  if (adverse) adverse_[i].fetch_add(1, std::memory_order_relaxed);
  if (n >= kMinCalls && n % kRecomputeCadence == 0) {
    cached_ub_ppm_[i].store(
        compute_upper_bound_ppm(n, adverse_[i].load(std::memory_order_relaxed), z_),
        std::memory_order_relaxed);
  }
}

std::uint32_t RiskEnvelope::upper_bound_ppm(core::ApiFamily family) const noexcept {
  return cached_ub_ppm_[core::family_index(family)].load(std::memory_order_relaxed);
}

std::uint32_t RiskEnvelope::max_upper_bound_ppm() const noexcept {
  std::uint32_t m = 0;
  for (const auto& c : cached_ub_ppm_) m = std::max(m, c.load(std::memory_order_relaxed));
  return m;
}

RiskEnvelopeSummary RiskEnvelope::summary() const noexcept {
  RiskEnvelopeSummary s;
  for (std::size_t i = 0; i < core::kNumApiFamilies; ++i) {
    s.calls[i] = calls_[i].load(std::memory_order_relaxed);
    s.adverse[i] = adverse_[i].load(std::memory_order_relaxed);
    s.upper_bound_ppm[i] = cached_ub_ppm_[i].load(std::memory_order_relaxed);
  }
  return s;
}

}} // namespace msm::control
