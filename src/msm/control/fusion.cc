// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/control/fusion.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace msm { namespace control {

FusionWeights::FusionWeights(std::size_t num_signals) {
  if (num_signals == 0) throw std::invalid_argument("FusionWeights: num_signals must be positive");
  const double u = 1.0 / static_cast<double>(num_signals);
  weights_.assign(num_signals, u);
  prev_.assign(num_signals, u);
  normalized_.assign(num_signals, 0.0);
  summary_.entropy_milli = 1000;
}

double FusionWeights::scale_for(core::SafetyLevel mode) noexcept {
  switch (mode) {
    case core::SafetyLevel::Strict: return 220000.0;
    case core::SafetyLevel::Hardened: return 320000.0;
    case core::SafetyLevel::Off: return 80000.0;
  }
  return 220000.0;
}

void FusionWeights::renormalize_() noexcept {
  double sum = 0.0;
  for (double v : weights_) sum += std::max(v, 0.0);
  const double u = 1.0 / static_cast<double>(weights_.size());
  if (!(sum > 1e-12) || !std::isfinite(sum)) {
    std::fill(weights_.begin(), weights_.end(), u);
    return;
  }
  for (double& v : weights_) v = std::max(v, 0.0) / sum;
}

FusionSummary FusionWeights::observe(const std::vector<std::uint8_t>& levels, bool adverse,
                                     core::SafetyLevel mode) {
  const std::size_t n = weights_.size();
  prev_ = weights_;
  for (std::size_t i = 0; i < n; ++i) {
    const std::uint8_t l = i < levels.size() ? std::min<std::uint8_t>(levels[i], 3) : 0;
    normalized_[i] = static_cast<double>(l) / 3.0;
  }
  for (std::size_t i = 0; i < n; ++i) {
    const double s = normalized_[i];
    const double loss = adverse ? 1.0 - s : 0.2 + 0.8 * s;
    weights_[i] *= std::exp(-kEta * loss);
  }
  renormalize_();
  const double u = 1.0 / static_cast<double>(n);
  for (double& v : weights_) v = (1.0 - kUniformMix) * v + kUniformMix * u;
  renormalize_();

  double score = 0.0;
  double l1 = 0.0;
  double h = 0.0;
  std::size_t dominant = 0;
  for (std::size_t i = 0; i < n; ++i) {
    score += weights_[i] * normalized_[i];
    l1 += std::abs(prev_[i] - weights_[i]);
    if (weights_[i] > 1e-12) h -= weights_[i] * std::log(weights_[i]);
    if (weights_[i] > weights_[dominant]) dominant = i;
  }
  const double drift = std::clamp(l1 * 0.5, 0.0, 1.0);
  const double hmax = std::log(static_cast<double>(n));
  const double entropy = hmax > 1e-12 ? std::clamp(h / hmax, 0.0, 1.0) : 0.0;

  double bonus = score * scale_for(mode);
  if (adverse) bonus += drift * 90000.0;
  summary_.bonus_ppm = static_cast<std::uint32_t>(std::min(bonus, static_cast<double>(kMaxBonusPpm)));
  summary_.drift_ppm = static_cast<std::uint32_t>(drift * 1e6);
  summary_.entropy_milli = static_cast<std::uint32_t>(entropy * 1000.0);
  summary_.dominant_signal = dominant;
  summary_.updates += 1;
  return summary_;
}

}} // namespace msm::control
