// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "msm/monitors/chain_monitors.h"

#include <algorithm>
#include <cmath>

namespace msm { namespace monitors {

namespace {

constexpr double kTiny = 1e-12;

const double kLogLevels = std::log(static_cast<double>(kSeverityLevels));

// H(to | from) of a joint EWMA table, normalized to [0, 1].
double conditional_entropy(const TransitionRows::Matrix& joint) noexcept {
  double total = 0.0;
  for (const auto& row : joint)
    for (double p : row) total += p;
  if (total <= kTiny) return 0.0;
  double h = 0.0;
  for (const auto& row : joint) {
    double row_sum = 0.0;
    for (double p : row) row_sum += p;
    if (row_sum <= kTiny) continue;
    for (double p : row) {
      if (p <= kTiny) continue;
      h -= (p / total) * std::log(p / row_sum);
    }
  }
  return std::clamp(h / kLogLevels, 0.0, 1.0);
}

void ewma_joint(TransitionRows::Matrix& joint, std::size_t from, std::size_t to, double a) noexcept {
  for (std::size_t f = 0; f < kSeverityLevels; ++f) {
    for (std::size_t t = 0; t < kSeverityLevels; ++t) {
      const double target = (f == from && t == to) ? 1.0 : 0.0;
      joint[f][t] += a * (target - joint[f][t]);
    }
  }
}

std::size_t max_severity(const SeverityVector& v) noexcept {
  std::size_t m = 0;
  for (std::uint8_t s : v) m = std::max(m, sev_index(s));
  return m;
}

} // namespace

void TransitionRows::observe(std::size_t from, std::size_t to, double alpha) noexcept {
  auto& row = rows[from];
  for (std::size_t k = 0; k < kSeverityLevels; ++k) {
    row[k] += alpha * ((k == to ? 1.0 : 0.0) - row[k]);
    occupancy[k] += alpha * ((k == from ? 1.0 : 0.0) - occupancy[k]);
  }
}

double TransitionRows::row_mass(std::size_t k) const noexcept {
  double s = 0.0;
  for (double p : rows[k]) s += p;
  return s;
}

bool TransitionRows::row_distribution(std::size_t k, std::array<double, kSeverityLevels>& out) const noexcept {
  const double mass = row_mass(k);
  if (mass <= kTiny) return false;
  for (std::size_t j = 0; j < kSeverityLevels; ++j) out[j] = rows[k][j] / mass;
  return true;
}

FanoEquivocationMonitor::FanoEquivocationMonitor() noexcept
    : Monitor("fano_equivocation", kWarmup, {"Calibrating", "Predictable", "Uncertain", "Chaotic"}) {}

Level FanoEquivocationMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  if (has_prev_) {
    double sum = 0.0;
    for (std::size_t i = 0; i < kSeverityWidth; ++i) {
      ewma_joint(joint_[i], sev_index(prev_[i]), sev_index(v[i]), a);
      sum += conditional_entropy(joint_[i]);
    }
    equivocation_ += a * (sum / static_cast<double>(kSeverityWidth) - equivocation_);
  }
  prev_ = v;
  has_prev_ = true;
  return classify_high(equivocation_, kUncertainThreshold, kChaoticThreshold);
}

DobrushinContractionMonitor::DobrushinContractionMonitor() noexcept
    : Monitor("dobrushin_contraction", kWarmup, {"Calibrating", "Contracting", "SlowMixing", "NonContractive"}) {}

Level DobrushinContractionMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  if (has_prev_) {
    double worst = 0.0;
    for (std::size_t i = 0; i < kSeverityWidth; ++i) {
      TransitionRows& c = chains_[i];
      c.observe(sev_index(prev_[i]), sev_index(v[i]), a);
      std::array<std::array<double, kSeverityLevels>, kSeverityLevels> dist{};
      std::array<bool, kSeverityLevels> usable{};
      for (std::size_t k = 0; k < kSeverityLevels; ++k) {
        usable[k] = c.occupancy[k] >= kMinOccupancy && c.row_distribution(k, dist[k]);
      }
      for (std::size_t r = 0; r < kSeverityLevels; ++r) {
        if (!usable[r]) continue;
        for (std::size_t s = r + 1; s < kSeverityLevels; ++s) {
          if (!usable[s]) continue;
          double tv = 0.0;
          for (std::size_t k = 0; k < kSeverityLevels; ++k) tv += std::abs(dist[r][k] - dist[s][k]);
          worst = std::max(worst, 0.5 * tv);
        }
      }
    }
    coefficient_ += a * (worst - coefficient_);
  }
  prev_ = v;
  has_prev_ = true;
  return classify_high(coefficient_, kSlowThreshold, kNonContractiveThreshold);
}

SpectralGapMonitor::SpectralGapMonitor() noexcept
    : Monitor("spectral_gap", kWarmup, {"Calibrating", "RapidMixing", "SlowMixing", "NearDecomposable"}) {}

double SpectralGapMonitor::second_eigenvalue(const TransitionRows::Matrix& p) noexcept {
  constexpr std::size_t K = kSeverityLevels;
  // P 1 = 1, so projecting out the mean after each multiply removes the
  // unit eigenvalue and leaves the rest of the spectrum.
  std::array<double, K> v{0.5, -0.5, 0.5, -0.5};
  double ratio = 0.0;
  for (int it = 0; it < kIterations; ++it) {
    std::array<double, K> w{};
    double mean = 0.0;
    for (std::size_t r = 0; r < K; ++r) {
      for (std::size_t c = 0; c < K; ++c) w[r] += p[r][c] * v[c];
      mean += w[r];
    }
    mean /= static_cast<double>(K);
    double norm = 0.0;
    for (std::size_t r = 0; r < K; ++r) {
      w[r] -= mean;
      norm += w[r] * w[r];
    }
    norm = std::sqrt(norm);
    if (norm <= kTiny) return 0.0;
    ratio = norm;  // v has unit norm
    for (std::size_t r = 0; r < K; ++r) v[r] = w[r] / norm;
  }
  return std::min(ratio, 1.0);
}

Level SpectralGapMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  if (has_prev_) {
    for (std::size_t i = 0; i < kSeverityWidth; ++i) {
      chains_[i].observe(sev_index(prev_[i]), sev_index(v[i]), a);
    }
  }
  prev_ = v;
  has_prev_ = true;

  if (n % kSampleInterval == 0) {
    double worst = 0.0;
    for (const TransitionRows& c : chains_) {
      double occ_total = 0.0;
      for (double o : c.occupancy) occ_total += o;
      TransitionRows::Matrix p{};
      for (std::size_t k = 0; k < kSeverityLevels; ++k) {
        std::array<double, kSeverityLevels> row{};
        if (c.occupancy[k] >= kMinOccupancy && c.row_distribution(k, row)) {
          p[k] = row;
        } else if (occ_total > kTiny) {
          for (std::size_t j = 0; j < kSeverityLevels; ++j) p[k][j] = c.occupancy[j] / occ_total;
        } else {
          p[k].fill(1.0 / static_cast<double>(kSeverityLevels));
        }
      }
      worst = std::max(worst, second_eigenvalue(p));
    }
    if (!sampled_) {
      second_eigenvalue_ = worst;
      sampled_ = true;
    } else {
      second_eigenvalue_ += kSampleAlpha * (worst - second_eigenvalue_);
    }
  }
  return classify_high(second_eigenvalue_, kSlowMixingThreshold, kNearDecomposableThreshold);
}

EntropyRateMonitor::EntropyRateMonitor() noexcept
    : Monitor("entropy_rate", kWarmup, {"Calibrating", "Ordered", "Elevated", "Disordered"}) {}

Level EntropyRateMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  const std::size_t u = max_severity(v);
  if (has_prev_) {
    ewma_joint(joint_, prev_, u, a);
    rate_ += a * (conditional_entropy(joint_) - rate_);
  }
  prev_ = u;
  has_prev_ = true;
  return classify_high(rate_, kElevatedThreshold, kDisorderedThreshold);
}

TransferEntropyMonitor::TransferEntropyMonitor() noexcept
    : Monitor("transfer_entropy", kWarmup, {"Calibrating", "Independent", "Coupled", "Cascading"}) {}

Level TransferEntropyMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  std::array<std::uint8_t, kSeverityWidth> bits{};
  for (std::size_t i = 0; i < kSeverityWidth; ++i) bits[i] = v[i] >= 2 ? 1 : 0;

  if (has_prev_) {
    double best = 0.0;
    std::size_t best_pair = strongest_pair_;
    for (std::size_t p = 0; p < kPairs; ++p) {
      const std::size_t x_prev = prev_bits_[p];
      const std::size_t y_prev = prev_bits_[p + 1];
      const std::size_t y_next = bits[p + 1];
      const std::size_t cell = (y_next << 2) | (y_prev << 1) | x_prev;
      auto& j = joint_[p];
      double total = 0.0;
      for (std::size_t c = 0; c < j.size(); ++c) {
        j[c] += a * ((c == cell ? 1.0 : 0.0) - j[c]);
        total += j[c];
      }
      if (total <= kTiny) continue;

      // Marginals p(y, x), p(y', y), p(y).
      std::array<double, 4> yx{};
      std::array<double, 4> yny{};
      std::array<double, 2> y{};
      for (std::size_t c = 0; c < j.size(); ++c) {
        const double q = j[c] / total;
        const std::size_t yn = c >> 2, yp = (c >> 1) & 1, xp = c & 1;
        yx[(yp << 1) | xp] += q;
        yny[(yn << 1) | yp] += q;
        y[yp] += q;
      }
      double te = 0.0;
      for (std::size_t c = 0; c < j.size(); ++c) {
        const double q = j[c] / total;
        if (q <= kTiny) continue;
        const std::size_t yn = c >> 2, yp = (c >> 1) & 1, xp = c & 1;
        const double num = q * y[yp];
        const double den = yx[(yp << 1) | xp] * yny[(yn << 1) | yp];
        if (den <= kTiny) continue;
        te += q * std::log(num / den);
      }
      if (te > best) {
        best = te;
        best_pair = p;
      }
    }
    strongest_pair_ = best_pair;
    transfer_ += a * (std::max(0.0, best) - transfer_);
  }
  prev_bits_ = bits;
  has_prev_ = true;
  return classify_high(transfer_, kCouplingThreshold, kCascadeThreshold);
}

RenewalMonitor::RenewalMonitor() noexcept
    : Monitor("renewal", kWarmup, {"Calibrating", "Renewing", "Aging", "Stalled"}) {}

Level RenewalMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  double worst = 0.0;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    Tracker& t = trackers_[i];
    if (v[i] == 0) {
      if (t.renewals > 0) {
        const double interval = static_cast<double>(n - t.last_renewal);
        if (t.renewals == 1) t.mean_interval = interval;
        else t.mean_interval += kAlpha * (interval - t.mean_interval);
      }
      ++t.renewals;
      t.last_renewal = n;
      continue;
    }
    if (t.renewals < kMinRenewals || t.mean_interval <= 0.0) continue;
    const double age = static_cast<double>(n - t.last_renewal);
    worst = std::max(worst, age / t.mean_interval);
  }
  age_ratio_ += a * (worst - age_ratio_);
  return classify_high(age_ratio_, kAgingThreshold, kStalledThreshold);
}

BorelCantelliMonitor::BorelCantelliMonitor() noexcept
    : Monitor("borel_cantelli", kWarmup, {"Calibrating", "Transient", "Recurrent", "Absorbing"}) {}

Level BorelCantelliMonitor::update(const SeverityVector& v, std::uint64_t n) {
  const double a = alpha_for(n, kAlpha);
  max_rate_ = 0.0;
  for (std::size_t i = 0; i < kSeverityWidth; ++i) {
    rate_[i] += a * ((v[i] >= 2 ? 1.0 : 0.0) - rate_[i]);
    max_rate_ = std::max(max_rate_, rate_[i]);
  }
  if (max_rate_ >= kAbsorbingRate) return Level::Critical;
  if (max_rate_ > kTransientRate) return Level::Warning;
  return Level::Nominal;
}

DispersionMonitor::DispersionMonitor() noexcept
    : Monitor("dispersion", kWindow * kWarmupWindows, {"Calibrating", "Poisson", "Clustered", "Underdispersed"}) {}

Level DispersionMonitor::update(const SeverityVector& v, std::uint64_t n) {
  for (std::uint8_t s : v) {
    if (s >= 2) {
      ++window_count_;
      break;
    }
  }
  if (n % kWindow == 0) {
    ++windows_;
    const double c = static_cast<double>(window_count_);
    const double a = warmup_alpha(windows_, kWarmupWindows, kAlpha);
    mean_ += a * (c - mean_);
    second_moment_ += a * (c * c - second_moment_);
    window_count_ = 0;
    if (mean_ > kMinMean) {
      index_ = std::max(0.0, second_moment_ - mean_ * mean_) / mean_;
    } else {
      index_ = 1.0;
    }
  }
  if (index_ >= kClusteredThreshold) return Level::Warning;
  if (index_ <= kUnderdispersedThreshold) return Level::Critical;
  return Level::Nominal;
}

}} // namespace msm::monitors
