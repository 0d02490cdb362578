// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/monitors/drift_monitors.h"

#include <algorithm>
#include <cmath>

namespace msm { namespace monitors {

namespace {

double aggregate_severity(const SeverityVector& v) noexcept {
  double sum = 0.0;
  for (std::uint8_t s : v) sum += sev(s);
  return sum / (kMaxSeverity * static_cast<double>(kSeverityWidth));
}

} // namespace

WassersteinDriftMonitor::WassersteinDriftMonitor() noexcept
    : Monitor("wasserstein_drift", kWarmup, {"Calibrating", "Stable", "Drifting", "Shifted"}) {}

Level WassersteinDriftMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  const bool learning = n <= kWarmup;
  double sum_sq = 0.0;
  double worst = -1.0;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    const std::size_t bin = sev_index(v[i]);
    Hist& cur = current_[i];
    for (std::size_t k = 0; k < kSeverityLevels; ++k) {
      const double target = k == bin ? 1.0 : 0.0;
      cur[k] += a * (target - cur[k]);
    }
    if (learning) baseline_[i] = cur;
    // W1 on an ordered support is the L1 distance between CDFs.
    double cdf_b = 0.0, cdf_c = 0.0, w1 = 0.0;
    for (std::size_t k = 0; k + 1 < kSeverityLevels; ++k) {
      cdf_b += baseline_[i][k];
      cdf_c += cur[k];
      w1 += std::abs(cdf_b - cdf_c);
    }
    w1 /= static_cast<double>(kSeverityLevels - 1);
    distance_[i] += a * (w1 - distance_[i]);
    sum_sq += distance_[i] * distance_[i];
    if (distance_[i] > worst) {
      worst = distance_[i];
      worst_signal_ = i;
    }
  }
  aggregate_ = std::sqrt(sum_sq / static_cast<double>(kSeverityWidth));
  return classify_high(aggregate_, kDriftThreshold, kShiftThreshold);
}

KernelMmdMonitor::KernelMmdMonitor() noexcept
    : Monitor("kernel_mmd", kWarmup, {"Calibrating", "WithinDistribution", "Drifting", "Anomalous"}) {
  base_var_.fill(kVarFloor);
  var_.fill(kVarFloor);
}

Level KernelMmdMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  double dist_sq = 0.0;
  double log_ratio = 0.0;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    const double x = sev(v[i]);
    const double old_mean = mean_[i];
    mean_[i] += a * (x - mean_[i]);
    const double dev = (x - mean_[i]) * (x - old_mean);
    var_[i] = std::max(kVarFloor, var_[i] + a * (std::abs(dev) - var_[i]));
    if (n <= kWarmup) {
      base_mean_[i] = mean_[i];
      base_var_[i] = var_[i];
    }
    const double d = mean_[i] - base_mean_[i];
    dist_sq += d * d;
    log_ratio += std::abs(std::log(var_[i] / base_var_[i]));
  }
  const double k = std::exp(-dist_sq / (2.0 * kSigmaSq));
  const double raw = 2.0 * (1.0 - k) + 0.5 * log_ratio / static_cast<double>(kSeverityWidth);
  mmd_ += a * (raw - mmd_);
  return classify_high(mmd_, kDriftThreshold, kAnomalyThreshold);
}

DoobDriftMonitor::DoobDriftMonitor() noexcept
    : Monitor("doob_drift", kWarmup, {"Calibrating", "Martingale", "Drifting", "StructuralBreak"}) {}

Level DoobDriftMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double af = alpha_for(n, kFastAlpha);
  const double as = alpha_for(n, kSlowAlpha);
  double worst = 0.0;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    const double x = sev(v[i]);
    fast_[i] += af * (x - fast_[i]);
    slow_[i] += as * (x - slow_[i]);
    worst = std::max(worst, std::abs(fast_[i] - slow_[i]));
  }
  drift_ = worst / kMaxSeverity;
  return classify_high(drift_, kDriftThreshold, kBreakThreshold);
}

AzumaHoeffdingMonitor::AzumaHoeffdingMonitor() noexcept
    : Monitor("azuma_hoeffding", kWarmup, {"Calibrating", "Concentrated", "Diffuse", "Explosive"}) {}

double AzumaHoeffdingMonitor::radius() noexcept {
  const double n_eff = 2.0 / kFastAlpha - 1.0;
  return std::sqrt(2.0 * std::log(2.0 / kDelta) / n_eff);
}

Level AzumaHoeffdingMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double x = aggregate_severity(v);
  fast_ += alpha_for(n, kFastAlpha) * (x - fast_);
  slow_ += alpha_for(n, kSlowAlpha) * (x - slow_);
  ratio_ = std::abs(fast_ - slow_) / radius();
  return classify_high(ratio_, kDiffuseThreshold, kExplosiveThreshold);
}

BirkhoffErgodicMonitor::BirkhoffErgodicMonitor() noexcept
    : Monitor("birkhoff_ergodic", kWarmup, {"Calibrating", "Ergodic", "SlowConvergence", "NonErgodic"}) {}

Level BirkhoffErgodicMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double x = aggregate_severity(v);
  fast_ += alpha_for(n, kFastAlpha) * (x - fast_);
  slow_ += alpha_for(n, kSlowAlpha) * (x - slow_);
  gap_ += alpha_for(n, kGapAlpha) * (std::abs(fast_ - slow_) - gap_);
  return classify_high(gap_, kSlowConvergenceThreshold, kNonErgodicThreshold);
}

MatrixConcentrationMonitor::MatrixConcentrationMonitor() noexcept
    : Monitor("matrix_concentration", kWarmup, {"Calibrating", "WithinBounds", "Approaching", "Violated"}) {}

double MatrixConcentrationMonitor::tolerance() const noexcept {
  return std::sqrt(2.0 * base_energy_sq_ * kLogTerm / kEffectiveSamples) +
         kLogTerm / (3.0 * kEffectiveSamples);
}

Level MatrixConcentrationMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  const bool learning = n <= kWarmup;
  double norm_sq = 0.0;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    const double x = sev(v[i]);
    if (learning) base_mean_[i] += a * (x - base_mean_[i]);
    const double d = x - base_mean_[i];
    norm_sq += d * d;
  }
  const double e = norm_sq / (kMaxSeverity * kMaxSeverity * static_cast<double>(kSeverityWidth));
  if (learning) base_energy_sq_ += a * (e * e - base_energy_sq_);
  energy_ += a * (e - energy_);
  const double t = tolerance();
  if (energy_ > t) return Level::Critical;
  if (energy_ > kWarningFraction * t) return Level::Warning;
  return Level::Nominal;
}

PacBayesMonitor::PacBayesMonitor() noexcept
    : Monitor("pac_bayes", kWarmup, {"Calibrating", "Tight", "Loose", "Vacuous"}) {}

Level PacBayesMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  const double width = static_cast<double>(kSeverityWidth);
  double total = 0.0;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    const double hit = v[i] >= 2 ? 1.0 : 0.0;
    error_[i] += a * (hit - error_[i]);
    total += error_[i];
  }
  kl_ = 0.0;
  const double denom = total + kPriorSmoothing;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    const double q = (error_[i] + kPriorSmoothing / width) / denom;
    if (q > 0.0) kl_ += q * std::log(q * width);
  }
  kl_ = std::max(0.0, kl_);
  const double n_eff = std::min(static_cast<double>(n), 2.0 / kAlpha - 1.0);
  const double emp = total / width;
  bound_ = emp + std::sqrt((kl_ + std::log(2.0 * std::sqrt(n_eff) / kDelta)) / (2.0 * n_eff));
  if (kl_ >= kKlCritical || bound_ >= kBoundCritical) return Level::Critical;
  if (kl_ >= kKlWarning || bound_ >= kBoundWarning) return Level::Warning;
  return Level::Nominal;
}

}} // namespace msm::monitors
