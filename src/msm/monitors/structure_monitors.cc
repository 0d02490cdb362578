// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/monitors/structure_monitors.h"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "msm/monitors/base_signals.h"

namespace msm { namespace monitors {

namespace {

constexpr std::size_t idx(Signal s) noexcept { return static_cast<std::size_t>(s); }

struct SosGroup {
  std::array<std::size_t, 6> members;
  std::size_t size;
  double budget;
};

const std::array<SosGroup, SosInvariantMonitor::kGroups>& sos_groups() noexcept {
  static const std::array<SosGroup, SosInvariantMonitor::kGroups> groups = {{
      // temporal safety
      {{idx(Signal::TemporalRate), idx(Signal::DoubleFree), idx(Signal::ForeignFree),
        idx(Signal::InvalidFree), idx(Signal::CanaryCorruption), 0},
       5, 0.30},
      // capacity
      {{idx(Signal::QuarantineBytePressure), idx(Signal::QuarantineDepthPressure),
        idx(Signal::AllocFailure), idx(Signal::FreeContention), idx(Signal::EvictionRate), 0},
       5, 0.45},
      // validation
      {{idx(Signal::ValidateLatency), idx(Signal::FullProfileRate), idx(Signal::ForeignRate),
        idx(Signal::CacheMissRate), idx(Signal::BloomRejectRate), idx(Signal::ArenaMissRate)},
       6, 0.40},
  }};
  return groups;
}

} // namespace

LocalizationMonitor::LocalizationMonitor() noexcept
    : Monitor("localization", kWarmup, {"Calibrating", "Distributed", "Localized", "ConcentratedAnomaly"}) {}

Level LocalizationMonitor::update(const SeverityVector& v, std::uint64_t n) {
  std::size_t fixed = 0;
  double sum = 0.0, sum_sq = 0.0;
  for (std::uint8_t raw : v) {
    if (raw <= kFixedPointSeverity) {
      ++fixed;
      continue;
    }
    const double s = sev(raw);
    sum += s;
    sum_sq += s * s;
  }
  const double loc = sum > 0.0 ? sum_sq / (sum * sum) : 0.0;
  const double fp = static_cast<double>(fixed) / static_cast<double>(kSeverityWidth);
  if (n == 1) {
    localization_ = loc;
    fixed_fraction_ = fp;
  } else {
    localization_ += kAlpha * (loc - localization_);
    fixed_fraction_ += kAlpha * (fp - fixed_fraction_);
  }
  if (euler_weight() >= kConcentratedThreshold) return Level::Critical;
  if (localization_ >= kLocalizedThreshold) return Level::Warning;
  return Level::Nominal;
}

HodgeCoherenceMonitor::HodgeCoherenceMonitor() noexcept
    : Monitor("hodge_coherence", kWarmup, {"Calibrating", "Coherent", "Incoherent", "Inconsistent"}) {}

Level HodgeCoherenceMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  std::array<double, kSeverityWidth> potential{};
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    for (std::size_t j = i + 1; j < kSeverityWidth; ++j) {
      const double d = sev(v[i]) - sev(v[j]);
      const double sign = d > 0.0 ? 1.0 : (d < 0.0 ? -1.0 : 0.0);
      double& f = flow_[pair_index(i, j)];
      f += a * (sign - f);
      potential[i] += f;
      potential[j] -= f;
    }
  }
  // On the complete graph the least-squares potential is the mean outflow
  // and the harmonic part vanishes, so the residual is pure curl.
  const double width = static_cast<double>(kSeverityWidth);
  double total = 0.0, residual = 0.0;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    for (std::size_t j = i + 1; j < kSeverityWidth; ++j) {
      const double f = flow_[pair_index(i, j)];
      const double r = f - (potential[i] - potential[j]) / width;
      total += f * f;
      residual += r * r;
    }
  }
  const double raw = total > kMinEnergy ? residual / total : 0.0;
  curl_ratio_ += a * (raw - curl_ratio_);
  return classify_high(curl_ratio_, kIncoherentThreshold, kInconsistentThreshold);
}

ObstructionMonitor::ObstructionMonitor() noexcept
    : Monitor("obstruction", kWarmup, {"Calibrating", "Consistent", "PartialObstruction", "Obstructed"}) {}

const std::array<std::pair<std::size_t, std::size_t>, ObstructionMonitor::kTrackedPairs>&
ObstructionMonitor::tracked_pairs() noexcept {
  static const std::array<std::pair<std::size_t, std::size_t>, kTrackedPairs> pairs = {{
      {idx(Signal::DoubleFree), idx(Signal::TemporalRate)},
      {idx(Signal::ForeignFree), idx(Signal::ForeignRate)},
      {idx(Signal::ArenaMissRate), idx(Signal::ForeignRate)},
      {idx(Signal::BloomRejectRate), idx(Signal::ForeignRate)},
      {idx(Signal::PageOracleDisagreement), idx(Signal::BloomRejectRate)},
      {idx(Signal::CacheMissRate), idx(Signal::FullProfileRate)},
      {idx(Signal::QuarantineBytePressure), idx(Signal::QuarantineDepthPressure)},
      {idx(Signal::FreeLatency), idx(Signal::FreeContention)},
      {idx(Signal::ValidateLatency), idx(Signal::StageCost)},
      {idx(Signal::InvalidFree), idx(Signal::InteriorPointerRate)},
      {idx(Signal::CanaryCorruption), idx(Signal::FingerprintMismatch)},
      {idx(Signal::EvictionRate), idx(Signal::QuarantineBytePressure)},
  }};
  return pairs;
}

Level ObstructionMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  const auto& pairs = tracked_pairs();
  double sum = 0.0;
  for (std::size_t p = 0; p < kTrackedPairs; ++p) {
    const double d = std::abs(sev(v[pairs[p].first]) - sev(v[pairs[p].second])) / kMaxSeverity;
    gap_[p] += a * (d - gap_[p]);
    sum += gap_[p];
  }
  obstruction_ = sum / static_cast<double>(kTrackedPairs);
  return classify_high(obstruction_, kPartialThreshold, kObstructedThreshold);
}

SosInvariantMonitor::SosInvariantMonitor() noexcept
    : Monitor("sos_invariant", kWarmup, {"Calibrating", "Certified", "Stressed", "Violated"}) {}

Level SosInvariantMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  stress_ = 0.0;
  const auto& groups = sos_groups();
  for (std::size_t g = 0; g < kGroups; ++g) {
    double q = 0.0;
    for (std::size_t k = 0; k < groups[g].size; ++k) {
      const double x = sev(v[groups[g].members[k]]) / kMaxSeverity;
      q += x * x;
    }
    q /= static_cast<double>(groups[g].size);
    energy_[g] += a * (q - energy_[g]);
    const double s = energy_[g] / groups[g].budget;
    if (s > stress_) {
      stress_ = s;
      worst_group_ = g;
    }
  }
  return classify_high(stress_, kStressedThreshold, kViolatedThreshold);
}

NerveComplexMonitor::NerveComplexMonitor() noexcept
    : Monitor("nerve_complex", kWarmup, {"Calibrating", "Connected", "Fragmented", "Shattered"}) {}

Level NerveComplexMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  std::array<double, kSignals> x{};
  for (std::size_t i = 0; i < kSignals; ++i) x[i] = sev(v[i]);
  for (std::size_t i = 0; i < kSignals; ++i) {
    mean_[i] += a * (x[i] - mean_[i]);
    for (std::size_t j = i; j < kSignals; ++j) moment_[i][j] += a * (x[i] * x[j] - moment_[i][j]);
  }

  std::array<double, kSignals> var{};
  std::array<bool, kSignals> active{};
  std::array<std::size_t, kSignals> parent{};
  std::iota(parent.begin(), parent.end(), std::size_t{0});
  auto find = [&parent](std::size_t i) {
    while (parent[i] != i) {
      parent[i] = parent[parent[i]];
      i = parent[i];
    }
    return i;
  };
  std::size_t components = 0;
  for (std::size_t i = 0; i < kSignals; ++i) {
    var[i] = moment_[i][i] - mean_[i] * mean_[i];
    active[i] = var[i] > kActiveVariance;
    if (active[i]) ++components;
  }
  for (std::size_t i = 0; i < kSignals; ++i) {
    if (!active[i]) continue;
    for (std::size_t j = i + 1; j < kSignals; ++j) {
      if (!active[j]) continue;
      const double cov = moment_[i][j] - mean_[i] * mean_[j];
      const double corr = cov / std::sqrt(var[i] * var[j]);
      if (std::abs(corr) < kEdgeCorrelation) continue;
      const std::size_t ri = find(i), rj = find(j);
      if (ri != rj) {
        parent[ri] = rj;
        --components;
      }
    }
  }
  last_components_ = components;
  const double raw = components > 1 ? static_cast<double>(components - 1) : 0.0;
  excess_ += a * (raw - excess_);
  return classify_high(excess_, kFragmentedThreshold, kShatteredThreshold);
}

}} // namespace msm::monitors
