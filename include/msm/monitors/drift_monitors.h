// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>

#include "msm/monitors/monitor.h"

namespace msm { namespace monitors {

// Earth mover's distance between each signal's current severity histogram
// and the histogram frozen at the end of warmup, aggregated as an RMS over
// signals.
class WassersteinDriftMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 30;
  static constexpr double kAlpha = 0.05;
  static constexpr double kDriftThreshold = 0.15;
  static constexpr double kShiftThreshold = 0.40;

  WassersteinDriftMonitor() noexcept;
  double statistic() const noexcept override { return aggregate_; }
  double secondary() const noexcept override { return static_cast<double>(worst_signal_); }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  using Hist = std::array<double, kSeverityLevels>;
  std::array<Hist, kSeverityWidth> baseline_{};
  std::array<Hist, kSeverityWidth> current_{};
  std::array<double, kSeverityWidth> distance_{};
  double aggregate_{0.0};
  std::size_t worst_signal_{0};
};

// Gaussian-kernel two-sample discrepancy between the warmup mean/variance
// and the current EWMA mean/variance, plus a log variance-ratio term.
class KernelMmdMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 30;
  static constexpr double kAlpha = 0.05;
  static constexpr double kSigmaSq = 50.0;
  static constexpr double kVarFloor = 0.05;
  static constexpr double kDriftThreshold = 0.10;
  static constexpr double kAnomalyThreshold = 0.40;

  KernelMmdMonitor() noexcept;
  double statistic() const noexcept override { return mmd_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<double, kSeverityWidth> base_mean_{};
  std::array<double, kSeverityWidth> base_var_{};
  std::array<double, kSeverityWidth> mean_{};
  std::array<double, kSeverityWidth> var_{};
  double mmd_{0.0};
};

// Martingale drift: gap between a fast and a slow running mean per signal.
class DoobDriftMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 40;
  static constexpr double kFastAlpha = 0.03;
  static constexpr double kSlowAlpha = 0.003;
  static constexpr double kDriftThreshold = 0.30;
  static constexpr double kBreakThreshold = 0.60;

  DoobDriftMonitor() noexcept;
  double statistic() const noexcept override { return drift_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<double, kSeverityWidth> fast_{};
  std::array<double, kSeverityWidth> slow_{};
  double drift_{0.0};
};

// Aggregate mean deviation scaled by the Azuma-Hoeffding radius for
// bounded increments.
class AzumaHoeffdingMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 40;
  static constexpr double kFastAlpha = 0.03;
  static constexpr double kSlowAlpha = 0.003;
  static constexpr double kDelta = 0.01;
  static constexpr double kDiffuseThreshold = 0.6;
  static constexpr double kExplosiveThreshold = 1.0;

  AzumaHoeffdingMonitor() noexcept;
  double statistic() const noexcept override { return ratio_; }
  double secondary() const noexcept override { return radius(); }
  static double radius() noexcept;

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  double fast_{0.0};
  double slow_{0.0};
  double ratio_{0.0};
};

// Time-average vs long-run average of the aggregate severity.
class BirkhoffErgodicMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 60;
  static constexpr double kFastAlpha = 0.15;
  static constexpr double kSlowAlpha = 0.01;
  static constexpr double kGapAlpha = 0.03;
  static constexpr double kSlowConvergenceThreshold = 0.15;
  static constexpr double kNonErgodicThreshold = 0.40;

  BirkhoffErgodicMonitor() noexcept;
  double statistic() const noexcept override { return gap_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  double fast_{0.0};
  double slow_{0.0};
  double gap_{0.0};
};

// Normalized squared deviation from the warmup mean against a Bernstein
// tolerance derived from the warmup variance.
class MatrixConcentrationMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 30;
  static constexpr double kAlpha = 0.05;
  static constexpr double kLogTerm = 7.82;
  static constexpr double kEffectiveSamples = 39.0;
  static constexpr double kWarningFraction = 0.7;

  MatrixConcentrationMonitor() noexcept;
  double statistic() const noexcept override { return energy_; }
  double secondary() const noexcept override { return tolerance(); }
  double tolerance() const noexcept;

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<double, kSeverityWidth> base_mean_{};
  double base_energy_sq_{0.0};
  double energy_{0.0};
};

// PAC-Bayes bound on the per-signal error posterior against a uniform prior.
class PacBayesMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 40;
  static constexpr double kAlpha = 0.03;
  static constexpr double kDelta = 0.005;
  static constexpr double kPriorSmoothing = 0.05;
  static constexpr double kKlWarning = 1.5;
  static constexpr double kKlCritical = 3.0;
  static constexpr double kBoundWarning = 0.35;
  static constexpr double kBoundCritical = 0.6;

  PacBayesMonitor() noexcept;
  double statistic() const noexcept override { return bound_; }
  double secondary() const noexcept override { return kl_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<double, kSeverityWidth> error_{};
  double kl_{0.0};
  double bound_{0.0};
};

}} // namespace msm::monitors
