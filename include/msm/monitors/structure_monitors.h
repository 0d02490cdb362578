// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "msm/monitors/monitor.h"

namespace msm { namespace monitors {

// Inverse-participation ratio of the signals away from their fixed point
// (severity >= 2), amplified by the fraction that stayed fixed.
class LocalizationMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 128;
  static constexpr double kAlpha = 0.05;
  static constexpr std::uint8_t kFixedPointSeverity = 1;
  static constexpr double kLocalizedThreshold = 0.35;
  static constexpr double kConcentratedThreshold = 0.50;

  LocalizationMonitor() noexcept;
  double statistic() const noexcept override { return euler_weight(); }
  double secondary() const noexcept override { return localization_; }
  double euler_weight() const noexcept { return localization_ * fixed_fraction_ * fixed_fraction_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  double localization_{0.0};
  double fixed_fraction_{1.0};
};

// Hodge decomposition of the pairwise severity-ordering flow on the
// complete signal graph; reports the share of energy outside the gradient.
class HodgeCoherenceMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 40;
  static constexpr double kAlpha = 0.03;
  static constexpr double kMinEnergy = 1e-10;
  static constexpr std::size_t kPairs = kSeverityWidth * (kSeverityWidth - 1) / 2;
  static constexpr double kIncoherentThreshold = 0.15;
  static constexpr double kInconsistentThreshold = 0.35;

  HodgeCoherenceMonitor() noexcept;
  double statistic() const noexcept override { return curl_ratio_; }

  static constexpr std::size_t pair_index(std::size_t i, std::size_t j) noexcept {
    return i * kSeverityWidth - i * (i + 1) / 2 + (j - i - 1);
  }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<double, kPairs> flow_{};
  double curl_ratio_{0.0};
};

// Disagreement between signals that should move together.
class ObstructionMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 128;
  static constexpr double kAlpha = 0.05;
  static constexpr std::size_t kTrackedPairs = 12;
  static constexpr double kPartialThreshold = 0.25;
  static constexpr double kObstructedThreshold = 0.60;

  ObstructionMonitor() noexcept;
  double statistic() const noexcept override { return obstruction_; }

  static const std::array<std::pair<std::size_t, std::size_t>, kTrackedPairs>& tracked_pairs() noexcept;

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<double, kTrackedPairs> gap_{};
  double obstruction_{0.0};
};

// Quadratic energy budgets over groups of related signals.
class SosInvariantMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 128;
  static constexpr double kAlpha = 0.05;
  static constexpr std::size_t kGroups = 3;
  static constexpr double kStressedThreshold = 0.7;
  static constexpr double kViolatedThreshold = 1.0;

  SosInvariantMonitor() noexcept;
  double statistic() const noexcept override { return stress_; }
  double secondary() const noexcept override { return static_cast<double>(worst_group_); }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<double, kGroups> energy_{};
  double stress_{0.0};
  std::size_t worst_group_{0};
};

// Connected components of the correlation graph over the first kSignals
// signals; fragmentation into several clusters of co-moving signals is
// reported as excess components.
class NerveComplexMonitor final : public Monitor {
 public:
  static constexpr std::size_t kSignals = 16;
  static constexpr std::uint64_t kWarmup = 30;
  static constexpr double kAlpha = 0.05;
  static constexpr double kActiveVariance = 1e-3;
  static constexpr double kEdgeCorrelation = 0.15;
  static constexpr double kFragmentedThreshold = 2.0;
  static constexpr double kShatteredThreshold = 4.0;

  NerveComplexMonitor() noexcept;
  double statistic() const noexcept override { return excess_; }
  double secondary() const noexcept override { return static_cast<double>(last_components_); }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<double, kSignals> mean_{};
  std::array<std::array<double, kSignals>, kSignals> moment_{};
  double excess_{0.0};
  std::size_t last_components_{0};
};

}} // namespace msm::monitors
