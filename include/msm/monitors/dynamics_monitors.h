// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "msm/monitors/monitor.h"

namespace msm { namespace monitors {

// Critical slowing down: lag-1 autocorrelation approaching one.
class BifurcationMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 40;
  static constexpr double kAlpha = 0.03;
  static constexpr double kVarEps = 1e-3;
  static constexpr double kApproachingThreshold = 0.80;
  static constexpr double kCriticalThreshold = 0.95;

  BifurcationMonitor() noexcept;
  double statistic() const noexcept override { return rho_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<double, kSeverityWidth> mean_{};
  std::array<double, kSeverityWidth> mean_sq_{};
  std::array<double, kSeverityWidth> mean_lag_{};
  SeverityVector prev_{};
  double rho_{0.0};
};

// Mean-reversion rate theta = 1 - phi of an AR(1) fit per signal.
class OrnsteinUhlenbeckMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 50;
  static constexpr double kAlpha = 0.03;
  static constexpr double kMinLagEnergy = 1e-4;
  static constexpr double kDiffusingTheta = 0.02;
  static constexpr double kExplosiveTheta = -0.02;

  OrnsteinUhlenbeckMonitor() noexcept;
  double statistic() const noexcept override { return theta_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<double, kSeverityWidth> mean_{};
  std::array<double, kSeverityWidth> cross_{};
  std::array<double, kSeverityWidth> lag_energy_{};
  std::array<double, kSeverityWidth> prev_centered_{};
  double theta_{1.0};
};

// Finite-time growth rate of the separation between the trajectory and
// its own lagged copy.
class LyapunovMonitor final : public Monitor {
 public:
  static constexpr std::size_t kLag = 8;
  static constexpr std::uint64_t kWarmup = 18;
  static constexpr double kAlpha = 0.03;
  static constexpr double kMinNorm = 0.01;
  static constexpr double kSensitiveThreshold = 0.05;
  static constexpr double kChaoticThreshold = 0.15;

  LyapunovMonitor() noexcept;
  double statistic() const noexcept override { return exponent_; }

  // Euclidean distance between two severity vectors.
  static double distance(const SeverityVector& a, const SeverityVector& b) noexcept;

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<SeverityVector, kLag + 2> history_{};
  double exponent_{0.0};
};

// Gain of the deviation norm from the running mean: short-horizon average
// norm over long-horizon average norm.
class OperatorNormMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 128;
  static constexpr double kAlpha = 0.05;
  static constexpr double kFastAlpha = 0.2;
  static constexpr double kSlowAlpha = 0.02;
  static constexpr double kMinNorm = 0.1;
  static constexpr double kMarginalThreshold = 1.5;
  static constexpr double kUnstableThreshold = 2.5;

  OperatorNormMonitor() noexcept;
  double statistic() const noexcept override { return gain_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<double, kSeverityWidth> mean_{};
  double fast_norm_{0.0};
  double slow_norm_{0.0};
  double gain_{0.0};
};

// Rescaled-range Hurst exponent of the aggregate severity.
class HurstMonitor final : public Monitor {
 public:
  static constexpr std::size_t kWindow = 64;
  static constexpr std::size_t kBlock = 16;
  static constexpr std::uint64_t kWarmup = kWindow;
  static constexpr std::uint64_t kSampleInterval = 16;
  static constexpr double kAlpha = 0.05;
  static constexpr double kPersistentThreshold = 0.6;
  static constexpr double kAntiPersistentThreshold = 0.4;

  HurstMonitor() noexcept;
  double statistic() const noexcept override { return hurst_; }

  // R/S of a series; returns false when its deviation is zero.
  static bool rescaled_range(const double* x, std::size_t len, double& out) noexcept;

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  double estimate() const noexcept;

  std::array<double, kWindow> window_{};
  std::size_t head_{0};
  double hurst_{0.5};
};

// Realized quadratic variation per signal. Volatile signals move too much;
// frozen ones sit at an elevated level without moving.
class QuadraticVariationMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 40;
  static constexpr double kAlpha = 0.03;
  static constexpr double kFrozenLevel = 2.0;
  static constexpr double kFrozenVariation = 0.02;
  static constexpr double kVolatileVariation = 2.0;

  QuadraticVariationMonitor() noexcept;
  double statistic() const noexcept override { return max_variation_; }
  double secondary() const noexcept override { return frozen_level_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<double, kSeverityWidth> variation_{};
  std::array<double, kSeverityWidth> level_{};
  SeverityVector prev_{};
  double max_variation_{0.0};
  double frozen_level_{0.0};
};

// Sensitivity of the weighted aggregate to single-step perturbations.
class MalliavinMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 20;
  static constexpr double kAlpha = 0.05;
  static constexpr double kSensitiveThreshold = 0.10;
  static constexpr double kFragileThreshold = 0.35;
  static constexpr double kFragilityIndexThreshold = 0.70;

  MalliavinMonitor() noexcept;
  double statistic() const noexcept override { return sensitivity_; }
  double secondary() const noexcept override { return fragility_; }

  static double weight(std::size_t signal) noexcept;

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  SeverityVector prev_{};
  double prev_aggregate_{0.0};
  double sensitivity_{0.0};
  double fragility_{0.0};
};

}} // namespace msm::monitors
