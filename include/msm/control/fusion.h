// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "msm/core/safety_level.h"

namespace msm { namespace control {

struct FusionSummary {
  std::uint32_t bonus_ppm{0};
  std::uint32_t entropy_milli{0};   // normalized weight entropy, 1000 = uniform
  std::uint32_t drift_ppm{0};       // total-variation move of the last update
  std::size_t dominant_signal{0};
  std::uint64_t updates{0};
};

// Exponentiated-gradient trust weights over the ensemble members. Active
// members gain weight when an adverse outcome is observed and lose it on
// clean outcomes; the weighted activity becomes a bounded risk bonus.
// Not thread-safe; the owner serializes access.
class FusionWeights final {
 public:
  static constexpr double kEta = 0.14;
  static constexpr double kUniformMix = 0.02;
  static constexpr std::uint32_t kMaxBonusPpm = 280000;

  explicit FusionWeights(std::size_t num_signals);

  // levels[i] in [0, 3]; values above 3 are clamped.
  FusionSummary observe(const std::vector<std::uint8_t>& levels, bool adverse, core::SafetyLevel mode);

  std::uint32_t bonus_ppm() const noexcept { return summary_.bonus_ppm; }
  const std::vector<double>& weights() const noexcept { return weights_; }
  const FusionSummary& summary() const noexcept { return summary_; }

  static double scale_for(core::SafetyLevel mode) noexcept;

 private:
  void renormalize_() noexcept;

  std::vector<double> weights_;
  std::vector<double> prev_;
  std::vector<double> normalized_;
  FusionSummary summary_{};
};

}} // namespace msm::control
