// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/monitors/dynamics_monitors.h"

#include <algorithm>
#include <cmath>

#include "msm/monitors/base_signals.h"

namespace msm { namespace monitors {

BifurcationMonitor::BifurcationMonitor() noexcept
    : Monitor("bifurcation", kWarmup, {"Calibrating", "Stable", "Approaching", "CriticalSlowing"}) {}

Level BifurcationMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  double worst = 0.0;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    const double x = sev(v[i]);
    const double p = n > 1 ? sev(prev_[i]) : x;
    mean_[i] += a * (x - mean_[i]);
    mean_sq_[i] += a * (x * x - mean_sq_[i]);
    mean_lag_[i] += a * (x * p - mean_lag_[i]);
    const double var = mean_sq_[i] - mean_[i] * mean_[i];
    if (var <= kVarEps) continue;
    const double rho = (mean_lag_[i] - mean_[i] * mean_[i]) / var;
    worst = std::max(worst, std::clamp(rho, -1.0, 1.0));
  }
  prev_ = v;
  rho_ += a * (worst - rho_);
  return classify_high(rho_, kApproachingThreshold, kCriticalThreshold);
}

OrnsteinUhlenbeckMonitor::OrnsteinUhlenbeckMonitor() noexcept
    : Monitor("ornstein_uhlenbeck", kWarmup, {"Calibrating", "MeanReverting", "Diffusing", "Explosive"}) {}

Level OrnsteinUhlenbeckMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  double min_theta = 1.0;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    const double x = sev(v[i]);
    mean_[i] += a * (x - mean_[i]);
    const double c = x - mean_[i];
    const double lag = prev_centered_[i];
    cross_[i] += a * (c * lag - cross_[i]);
    lag_energy_[i] += a * (lag * lag - lag_energy_[i]);
    prev_centered_[i] = c;
    double phi = 0.0;
    if (lag_energy_[i] > kMinLagEnergy) phi = std::clamp(cross_[i] / lag_energy_[i], -1.0, 2.0);
    min_theta = std::min(min_theta, 1.0 - phi);
  }
  theta_ += a * (min_theta - theta_);
  if (theta_ < kExplosiveTheta) return Level::Critical;
  if (theta_ < kDiffusingTheta) return Level::Warning;
  return Level::Nominal;
}

LyapunovMonitor::LyapunovMonitor() noexcept
    : Monitor("lyapunov", kWarmup, {"Calibrating", "Stable", "Sensitive", "Chaotic"}) {}

double LyapunovMonitor::distance(const SeverityVector& a, const SeverityVector& b) noexcept {
  double s = 0.0;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    const double d = sev(a[i]) - sev(b[i]);
    s += d * d;
  }
  return std::sqrt(s);
}

Level LyapunovMonitor::update(const SeverityVector& v, std::uint64_t n) {
  // history_[0] is the newest vector.
  std::copy_backward(history_.begin(), history_.end() - 1, history_.end());
  history_[0] = v;
  if (n >= history_.size()) {
    const double now = distance(history_[0], history_[kLag]);
    const double before = distance(history_[1], history_[kLag + 1]);
    const double raw = std::log((now + kMinNorm) / (before + kMinNorm)) / static_cast<double>(kLag);
    exponent_ += alpha_for(n, kAlpha) * (raw - exponent_);
  }
  return classify_high(exponent_, kSensitiveThreshold, kChaoticThreshold);
}

OperatorNormMonitor::OperatorNormMonitor() noexcept
    : Monitor("operator_norm", kWarmup, {"Calibrating", "Contractive", "Marginal", "Unstable"}) {}

Level OperatorNormMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  double norm_sq = 0.0;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    const double x = sev(v[i]);
    const double d = x - mean_[i];
    norm_sq += d * d;
    mean_[i] += a * (x - mean_[i]);
  }
  const double norm = std::sqrt(norm_sq);
  fast_norm_ += alpha_for(n, kFastAlpha) * (norm - fast_norm_);
  slow_norm_ += alpha_for(n, kSlowAlpha) * (norm - slow_norm_);
  const double ratio = slow_norm_ >= kMinNorm ? fast_norm_ / slow_norm_ : 0.0;
  gain_ += a * (ratio - gain_);
  return classify_high(gain_, kMarginalThreshold, kUnstableThreshold);
}

HurstMonitor::HurstMonitor() noexcept
    : Monitor("hurst", kWarmup, {"Calibrating", "Independent", "Persistent", "AntiPersistent"}) {}

bool HurstMonitor::rescaled_range(const double* x, std::size_t len, double& out) noexcept {
  if (len < 2) return false;
  double mean = 0.0;
  for (std::size_t i = 0; i < len; ++i) mean += x[i];
  mean /= static_cast<double>(len);
  double cum = 0.0, lo = 0.0, hi = 0.0, ss = 0.0;
  for (std::size_t i = 0; i < len; ++i) {
    const double d = x[i] - mean;
    cum += d;
    lo = std::min(lo, cum);
    hi = std::max(hi, cum);
    ss += d * d;
  }
  const double sd = std::sqrt(ss / static_cast<double>(len));
  if (sd < 1e-9) return false;
  out = (hi - lo) / sd;
  return true;
}

double HurstMonitor::estimate() const noexcept {
  // Unroll the ring into time order.
  std::array<double, kWindow> series{};
  for (std::size_t i = 0; i < kWindow; ++i) series[i] = window_[(head_ + i) % kWindow];

  double full = 0.0;
  if (!rescaled_range(series.data(), kWindow, full) || full <= 0.0) return 0.5;
  double block_sum = 0.0;
  std::size_t blocks = 0;
  for (std::size_t b = 0; b + kBlock <= kWindow; b += kBlock) {
    double rs = 0.0;
    if (rescaled_range(series.data() + b, kBlock, rs) && rs > 0.0) {
      block_sum += rs;
      ++blocks;
    }
  }
  if (blocks == 0) return 0.5;
  const double h = std::log(full / (block_sum / static_cast<double>(blocks))) /
                   std::log(static_cast<double>(kWindow / kBlock));
  return std::clamp(h, 0.0, 1.0);
}

Level HurstMonitor::update(const SeverityVector& v, std::uint64_t n) {
  double sum = 0.0;
  for (std::uint8_t s : v) sum += sev(s);
  window_[head_] = sum / (kMaxSeverity * static_cast<double>(kSeverityWidth));
  head_ = (head_ + 1) % kWindow;

  if (n >= kWindow && n % kSampleInterval == 0) {
    hurst_ += kAlpha * (estimate() - hurst_);
  }
  if (hurst_ >= kPersistentThreshold) return Level::Warning;
  if (hurst_ <= kAntiPersistentThreshold) return Level::Critical;
  return Level::Nominal;
}

QuadraticVariationMonitor::QuadraticVariationMonitor() noexcept
    : Monitor("quadratic_variation", kWarmup, {"Calibrating", "Stable", "Frozen", "Volatile"}) {}

Level QuadraticVariationMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  max_variation_ = 0.0;
  frozen_level_ = 0.0;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    const double x = sev(v[i]);
    const double dx = n > 1 ? x - sev(prev_[i]) : 0.0;
    variation_[i] += a * (dx * dx - variation_[i]);
    level_[i] += a * (x - level_[i]);
    max_variation_ = std::max(max_variation_, variation_[i]);
    if (level_[i] >= kFrozenLevel && variation_[i] < kFrozenVariation) {
      frozen_level_ = std::max(frozen_level_, level_[i]);
    }
  }
  prev_ = v;
  if (max_variation_ >= kVolatileVariation) return Level::Critical;
  if (frozen_level_ > 0.0) return Level::Warning;
  return Level::Nominal;
}

MalliavinMonitor::MalliavinMonitor() noexcept
    : Monitor("malliavin", kWarmup, {"Calibrating", "Robust", "Sensitive", "Fragile"}) {}

double MalliavinMonitor::weight(std::size_t signal) noexcept {
  switch (static_cast<Signal>(signal)) {
    case Signal::TemporalRate:
    case Signal::DoubleFree:
    case Signal::ForeignFree:
    case Signal::InvalidFree:
    case Signal::CanaryCorruption:
    case Signal::RiskUpperBound:
      return 2.0;
    default:
      return 1.0;
  }
}

Level MalliavinMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  double total_w = 0.0, agg = 0.0, spike = 0.0;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    const double w = weight(i);
    const double x = sev(v[i]);
    total_w += w;
    agg += w * x;
    if (n > 1) spike = std::max(spike, w * std::abs(x - sev(prev_[i])));
  }
  agg /= kMaxSeverity * total_w;
  const double delta = n > 1 ? std::abs(agg - prev_aggregate_) : 0.0;
  sensitivity_ += a * (delta - sensitivity_);
  fragility_ += a * (spike / (2.0 * kMaxSeverity) - fragility_);
  prev_ = v;
  prev_aggregate_ = agg;
  if (sensitivity_ >= kFragileThreshold || fragility_ >= kFragilityIndexThreshold) return Level::Critical;
  if (sensitivity_ >= kSensitiveThreshold) return Level::Warning;
  return Level::Nominal;
}

}} // namespace msm::monitors
