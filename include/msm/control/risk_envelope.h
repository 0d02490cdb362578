// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <atomic>
#include <cstdint>

#include "msm/core/api_family.h"

namespace msm { namespace control {

struct RiskEnvelopeSummary {
  std::array<std::uint64_t, core::kNumApiFamilies> calls{};
  std::array<std::uint64_t, core::kNumApiFamilies> adverse{};
  std::array<std::uint32_t, core::kNumApiFamilies> upper_bound_ppm{};
};

// Per-family upper confidence bound on the adverse-outcome rate. Lock-free:
// observe() is a pair of relaxed increments, and the bound is recomputed
// every kRecomputeCadence calls once kMinCalls have been seen.
class RiskEnvelope final {
 public:
  static constexpr std::uint64_t kRecomputeCadence = 64;
  static constexpr std::uint64_t kMinCalls = 32;
  static constexpr std::uint32_t kDefaultPriorPpm = 20000;
  static constexpr double kDefaultZ = 3.0;

  explicit RiskEnvelope(std::uint32_t prior_ppm = kDefaultPriorPpm, double z = kDefaultZ);

  void observe(core::ApiFamily family, bool adverse) noexcept;
  std::uint32_t upper_bound_ppm(core::ApiFamily family) const noexcept;
  std::uint32_t max_upper_bound_ppm() const noexcept;

  RiskEnvelopeSummary summary() const noexcept;

  // Beta-binomial style bound: p = (a+1)/(n+2), ub = p + z*sqrt(p(1-p)/(n+3)).
  static std::uint32_t compute_upper_bound_ppm(std::uint64_t calls, std::uint64_t adverse, double z) noexcept;

 private:
  std::array<std::atomic<std::uint64_t>, core::kNumApiFamilies> calls_{};
  std::array<std::atomic<std::uint64_t>, core::kNumApiFamilies> adverse_{};
  std::array<std::atomic<std::uint32_t>, core::kNumApiFamilies> cached_ub_ppm_{};
  double z_;
};

}} // namespace msm::control
