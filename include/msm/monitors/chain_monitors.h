// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "msm/monitors/monitor.h"

namespace msm { namespace monitors {

// EWMA estimate of one signal's severity transition matrix. Only the row
// of the state being left is updated; occupancy tracks how often each row
// is visited so stale rows can be ignored.
struct TransitionRows {
  using Matrix = std::array<std::array<double, kSeverityLevels>, kSeverityLevels>;
  Matrix rows{};
  std::array<double, kSeverityLevels> occupancy{};

  void observe(std::size_t from, std::size_t to, double alpha) noexcept;
  double row_mass(std::size_t k) const noexcept;
  // Row k normalized to a distribution; false if it carries no mass.
  bool row_distribution(std::size_t k, std::array<double, kSeverityLevels>& out) const noexcept;
};

// Mean conditional entropy H(next | current) per signal, in units of ln 4.
class FanoEquivocationMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 40;
  static constexpr double kAlpha = 0.03;
  static constexpr double kUncertainThreshold = 0.50;
  static constexpr double kChaoticThreshold = 0.75;

  FanoEquivocationMonitor() noexcept;
  double statistic() const noexcept override { return equivocation_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<TransitionRows::Matrix, kSeverityWidth> joint_{};
  SeverityVector prev_{};
  bool has_prev_{false};
  double equivocation_{0.0};
};

// Largest total-variation distance between two occupied transition rows.
class DobrushinContractionMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 40;
  static constexpr double kAlpha = 0.03;
  static constexpr double kMinOccupancy = 0.05;
  static constexpr double kSlowThreshold = 0.65;
  static constexpr double kNonContractiveThreshold = 0.85;

  DobrushinContractionMonitor() noexcept;
  double statistic() const noexcept override { return coefficient_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<TransitionRows, kSeverityWidth> chains_{};
  SeverityVector prev_{};
  bool has_prev_{false};
  double coefficient_{0.0};
};

// Magnitude of the second eigenvalue of each signal's transition matrix,
// sampled periodically by deflated power iteration.
class SpectralGapMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 48;
  static constexpr double kAlpha = 0.03;
  static constexpr double kSampleAlpha = 0.2;
  static constexpr std::uint64_t kSampleInterval = 16;
  static constexpr int kIterations = 24;
  static constexpr double kMinOccupancy = 0.05;
  static constexpr double kSlowMixingThreshold = 0.85;
  static constexpr double kNearDecomposableThreshold = 0.95;

  SpectralGapMonitor() noexcept;
  double statistic() const noexcept override { return second_eigenvalue_; }
  double secondary() const noexcept override { return 1.0 - second_eigenvalue_; }

  // |lambda_2| of a row-stochastic 4x4 matrix.
  static double second_eigenvalue(const TransitionRows::Matrix& p) noexcept;

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<TransitionRows, kSeverityWidth> chains_{};
  SeverityVector prev_{};
  bool has_prev_{false};
  double second_eigenvalue_{0.0};
  bool sampled_{false};
};

// Entropy rate of the aggregate (max-severity) symbol stream.
class EntropyRateMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 40;
  static constexpr double kAlpha = 0.03;
  static constexpr double kElevatedThreshold = 0.40;
  static constexpr double kDisorderedThreshold = 0.70;

  EntropyRateMonitor() noexcept;
  double statistic() const noexcept override { return rate_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  TransitionRows::Matrix joint_{};
  std::size_t prev_{0};
  bool has_prev_{false};
  double rate_{0.0};
};

// Transfer entropy from each signal to its neighbour on binarized
// (severity >= 2) states.
class TransferEntropyMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 40;
  static constexpr double kAlpha = 0.03;
  static constexpr std::size_t kPairs = kSeverityWidth - 1;
  static constexpr double kCouplingThreshold = 0.08;
  static constexpr double kCascadeThreshold = 0.20;

  TransferEntropyMonitor() noexcept;
  double statistic() const noexcept override { return transfer_; }
  double secondary() const noexcept override { return static_cast<double>(strongest_pair_); }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  // Cells indexed by (y_next << 2) | (y_prev << 1) | x_prev.
  std::array<std::array<double, 8>, kPairs> joint_{};
  std::array<std::uint8_t, kSeverityWidth> prev_bits_{};
  bool has_prev_{false};
  double transfer_{0.0};
  std::size_t strongest_pair_{0};
};

// Age since the last return to severity 0, relative to the mean
// inter-renewal time.
class RenewalMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 40;
  static constexpr double kAlpha = 0.03;
  static constexpr std::uint64_t kMinRenewals = 3;
  static constexpr double kAgingThreshold = 3.0;
  static constexpr double kStalledThreshold = 8.0;

  RenewalMonitor() noexcept;
  double statistic() const noexcept override { return age_ratio_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  struct Tracker {
    std::uint64_t last_renewal{0};
    std::uint64_t renewals{0};
    double mean_interval{0.0};
  };
  std::array<Tracker, kSeverityWidth> trackers_{};
  double age_ratio_{0.0};
};

// Exceedance rate per signal; a rate near one means the bad state is
// visited almost surely infinitely often.
class BorelCantelliMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWarmup = 50;
  static constexpr double kAlpha = 0.03;
  static constexpr double kTransientRate = 0.05;
  static constexpr double kAbsorbingRate = 0.90;

  BorelCantelliMonitor() noexcept;
  double statistic() const noexcept override { return max_rate_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::array<double, kSeverityWidth> rate_{};
  double max_rate_{0.0};
};

// Variance-to-mean ratio of alarm counts over fixed windows.
class DispersionMonitor final : public Monitor {
 public:
  static constexpr std::uint64_t kWindow = 32;
  static constexpr std::uint64_t kWarmupWindows = 5;
  static constexpr double kAlpha = 0.1;
  static constexpr double kMinMean = 0.5;
  static constexpr double kClusteredThreshold = 1.8;
  static constexpr double kUnderdispersedThreshold = 0.3;

  DispersionMonitor() noexcept;
  double statistic() const noexcept override { return index_; }
  double secondary() const noexcept override { return mean_; }

 protected:
  Level update(const SeverityVector& v, std::uint64_t n) override;

 private:
  std::uint64_t window_count_{0};
  std::uint64_t windows_{0};
  double mean_{0.0};
  double second_moment_{0.0};
  double index_{1.0};
};

}} // namespace msm::monitors
