// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/control/probe_scheduler.h"

#include <algorithm>
#include <bitset>
#include <cmath>

namespace msm { namespace control {

namespace {
using Features = std::array<double, kLatentDim>;

// Latent axes: temporal, congestion, topological, regime.
constexpr std::array<Features, kNumProbes> kFeatures = {{
    {0.2, 0.3, 0.1, 0.9},  // Drift
    {0.6, 0.2, 0.0, 0.5},  // Martingale
    {0.3, 0.7, 0.1, 0.3},  // Concentration
    {0.7, 0.1, 0.2, 0.4},  // MarkovChain
    {0.2, 0.1, 0.8, 0.5},  // Spectral
    {0.5, 0.4, 0.4, 0.2},  // Causal
    {0.9, 0.3, 0.0, 0.1},  // Renewal
    {0.3, 0.2, 0.1, 1.0},  // Criticality
    {0.4, 0.5, 0.3, 0.6},  // Chaos
    {0.8, 0.1, 0.1, 0.7},  // LongMemory
    {0.2, 0.9, 0.1, 0.3},  // Volatility
    {0.1, 0.2, 1.0, 0.2},  // Topology
    {0.2, 0.6, 0.6, 0.1},  // Localization
}};

constexpr std::array<std::uint64_t, kNumProbes> kCostNs = {20, 8, 10, 12, 20, 16, 8, 10, 12, 28, 10, 30, 6};
} // namespace

std::uint64_t probe_cost_ns(Probe p) noexcept { return kCostNs[static_cast<std::size_t>(p)]; }

std::string_view to_string(Probe p) noexcept {
  switch (p) {
    case Probe::Drift: return "drift";
    case Probe::Martingale: return "martingale";
    case Probe::Concentration: return "concentration";
    case Probe::MarkovChain: return "markov_chain";
    case Probe::Spectral: return "spectral";
    case Probe::Causal: return "causal";
    case Probe::Renewal: return "renewal";
    case Probe::Criticality: return "criticality";
    case Probe::Chaos: return "chaos";
    case Probe::LongMemory: return "long_memory";
    case Probe::Volatility: return "volatility";
    case Probe::Topology: return "topology";
    case Probe::Localization: return "localization";
  }
  return "drift";
}

std::size_t ProbePlan::selected_count() const noexcept { return std::bitset<32>(mask).count(); }

void rank_one_update(InfoMatrix& m, const std::array<double, kLatentDim>& v, double w) noexcept {
  for (std::size_t i = 0; i < kLatentDim; ++i)
    for (std::size_t j = 0; j < kLatentDim; ++j) m[i][j] += w * v[i] * v[j];
}

// Cholesky log-determinant; -1e9 when the matrix is not positive definite.
double logdet_spd(const InfoMatrix& m) noexcept {
  InfoMatrix l{};
  for (std::size_t i = 0; i < kLatentDim; ++i) {
    for (std::size_t j = 0; j <= i; ++j) {
      double sum = m[i][j];
      for (std::size_t k = 0; k < j; ++k) sum -= l[i][k] * l[j][k];
      if (i == j) {
        if (sum <= 1e-12) return -1e9;
        l[i][j] = std::sqrt(sum);
      } else {
        l[i][j] = sum / std::max(l[j][j], 1e-12);
      }
    }
  }
  double logdet = 0.0;
  for (std::size_t i = 0; i < kLatentDim; ++i) logdet += 2.0 * std::log(l[i][i]);
  return logdet;
}

ProbeScheduler::ProbeScheduler() {
  for (std::size_t i = 0; i < kLatentDim; ++i) fisher_[i][i] = 1e-3;
}

std::uint64_t ProbeScheduler::budget_for(core::SafetyLevel level, bool fast_path_over_budget) noexcept {
  std::uint64_t b = 90;
  switch (level) {
    case core::SafetyLevel::Strict: b = 90; break;
    case core::SafetyLevel::Hardened: b = 220; break;
    case core::SafetyLevel::Off: b = 45; break;
  }
  if (fast_path_over_budget) b = (b * 3) / 4;
  return b;
}

ProbePlan ProbeScheduler::choose_plan(core::SafetyLevel level, std::uint32_t risk_upper_bound_ppm,
                                      bool adverse_hint, bool fast_path_over_budget) {
  const double risk = static_cast<double>(risk_upper_bound_ppm) / 1e6;
  ProbePlan plan;
  plan.mask = 0;
  plan.budget_ns = budget_for(level, fast_path_over_budget);
  auto add = [&](Probe p) {
    if ((plan.mask & probe_bit(p)) == 0) {
      plan.mask |= probe_bit(p);
      plan.expected_cost_ns += probe_cost_ns(p);
    }
  };

  // Cheap sentinels run regardless of budget.
  add(Probe::Martingale);
  add(Probe::Renewal);
  if (risk >= 0.20 || adverse_hint) {
    add(Probe::Concentration);
    add(Probe::Criticality);
  }
  if (core::heals_enabled(level) && (risk >= 0.15 || adverse_hint)) {
    add(Probe::Causal);
    add(Probe::Topology);
  }

  struct Candidate { Probe probe; double score; std::uint64_t cost; };
  std::array<Candidate, kNumProbes> cands{};
  std::size_t n = 0;
  const double base = logdet_spd(fisher_);
  for (std::size_t i = 0; i < kNumProbes; ++i) {
    const auto p = static_cast<Probe>(i);
    if (plan.includes(p)) continue;
    // Expensive structural probes wait while the fast path is over budget.
    if (fast_path_over_budget && risk < 0.5 && (p == Probe::LongMemory || p == Probe::Topology)) continue;
    InfoMatrix trial = fisher_;
    rank_one_update(trial, kFeatures[i], 0.25 + 2.5 * risk);
    const double gain = std::max(logdet_spd(trial) - base, 0.0);
    cands[n++] = Candidate{p, gain / (static_cast<double>(probe_cost_ns(p)) + 1.0), probe_cost_ns(p)};
  }
  std::stable_sort(cands.begin(), cands.begin() + static_cast<std::ptrdiff_t>(n),
                   [](const Candidate& a, const Candidate& b) { return a.score > b.score; });
  for (std::size_t i = 0; i < n; ++i) {
    if (plan.expected_cost_ns + cands[i].cost <= plan.budget_ns) add(cands[i].probe);
  }
  last_plan_ = plan;
  return plan;
}

void ProbeScheduler::record_probe(Probe p, bool anomaly_detected) {
  rank_one_update(fisher_, kFeatures[static_cast<std::size_t>(p)], anomaly_detected ? 1.25 : 0.20);
  ++observations_;
  if (anomaly_detected) ++anomaly_events_;
  if (observations_ % 1024 == 0) {
    for (std::size_t i = 0; i < kLatentDim; ++i) {
      for (double& v : fisher_[i]) v *= 0.985;
      fisher_[i][i] += 1e-4;
    }
  }
}

std::uint32_t ProbeScheduler::identifiability_ppm() const {
  const double shifted = std::max(logdet_spd(fisher_) + 20.0, 0.0);
  const double score = std::clamp(1.0 - std::exp(-0.05 * shifted), 0.0, 1.0);
  return static_cast<std::uint32_t>(score * 1e6);
}

ProbeSchedulerSummary ProbeScheduler::summary() const {
  ProbeSchedulerSummary s;
  s.identifiability_ppm = identifiability_ppm();
  s.selected_count = last_plan_.selected_count();
  s.mask = last_plan_.mask;
  s.budget_ns = last_plan_.budget_ns;
  s.expected_cost_ns = last_plan_.expected_cost_ns;
  s.observations = observations_;
  s.anomaly_events = anomaly_events_;
  return s;
}

}} // namespace msm::control
