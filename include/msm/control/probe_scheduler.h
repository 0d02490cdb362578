// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "msm/core/safety_level.h"

namespace msm { namespace control {

// Secondary probe groups. Each group gates the cadence of a set of ensemble
// monitors (see monitors/ensemble.h).
enum class Probe : std::uint8_t {
  Drift = 0,
  Martingale = 1,
  Concentration = 2,
  MarkovChain = 3,
  Spectral = 4,
  Causal = 5,
  Renewal = 6,
  Criticality = 7,
  Chaos = 8,
  LongMemory = 9,
  Volatility = 10,
  Topology = 11,
  Localization = 12,
};

inline constexpr std::size_t kNumProbes = 13;
inline constexpr std::size_t kLatentDim = 4;

inline constexpr std::uint32_t probe_bit(Probe p) noexcept { return 1u << static_cast<std::uint8_t>(p); }
inline constexpr std::uint32_t all_probes_mask() noexcept { return (1u << kNumProbes) - 1; }

std::uint64_t probe_cost_ns(Probe p) noexcept;
std::string_view to_string(Probe p) noexcept;

struct ProbePlan {
  std::uint32_t mask{all_probes_mask()};
  std::uint64_t budget_ns{0};
  std::uint64_t expected_cost_ns{0};

  bool includes(Probe p) const noexcept { return (mask & probe_bit(p)) != 0; }
  std::size_t selected_count() const noexcept;
};

struct ProbeSchedulerSummary {
  std::uint32_t identifiability_ppm{0};
  std::size_t selected_count{0};
  std::uint32_t mask{0};
  std::uint64_t budget_ns{0};
  std::uint64_t expected_cost_ns{0};
  std::uint64_t observations{0};
  std::uint64_t anomaly_events{0};
};

using InfoMatrix = std::array<std::array<double, kLatentDim>, kLatentDim>;

// Budgeted optimal-design selection of probe groups. Candidates are ranked
// by the log-determinant gain of a rank-one update to a small information
// matrix divided by cost. Not thread-safe; the owner serializes access.
class ProbeScheduler final {
 public:
  ProbeScheduler();

  ProbePlan choose_plan(core::SafetyLevel level, std::uint32_t risk_upper_bound_ppm,
                        bool adverse_hint, bool fast_path_over_budget);
  void record_probe(Probe p, bool anomaly_detected);

  std::uint32_t identifiability_ppm() const;
  const ProbePlan& last_plan() const noexcept { return last_plan_; }
  ProbeSchedulerSummary summary() const;

  static std::uint64_t budget_for(core::SafetyLevel level, bool fast_path_over_budget) noexcept;

 private:
  InfoMatrix fisher_{};
  ProbePlan last_plan_{};
  std::uint64_t observations_{0};
  std::uint64_t anomaly_events_{0};
};

// Exposed for tests.
double logdet_spd(const InfoMatrix& m) noexcept;
void rank_one_update(InfoMatrix& m, const std::array<double, kLatentDim>& v, double w) noexcept;

}} // namespace msm::control
