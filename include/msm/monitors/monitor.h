// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace msm { namespace monitors {

inline constexpr std::size_t kSeverityWidth = 25;
using SeverityVector = std::array<std::uint8_t, kSeverityWidth>;

// Severity codes are 0..3; anything larger is treated as 3.
inline constexpr std::size_t kSeverityLevels = 4;
inline constexpr double kMaxSeverity = 3.0;

inline double sev(std::uint8_t s) noexcept { return static_cast<double>(std::min<std::uint8_t>(s, 3)); }
inline std::size_t sev_index(std::uint8_t s) noexcept { return std::min<std::size_t>(s, 3); }

// Common four-level classification. Non-calibrating levels are ordered.
enum class Level : std::uint8_t {
  Calibrating = 0,
  Nominal = 1,
  Warning = 2,
  Critical = 3,
};

std::string_view to_string(Level l) noexcept;

// Per-monitor display names indexed by Level.
using StateNames = std::array<std::string_view, 4>;

struct MonitorSummary {
  std::string_view name;
  Level level{Level::Calibrating};
  std::string_view state_name;
  double statistic{0.0};
  double secondary{0.0};
  std::uint64_t observations{0};
  std::uint64_t critical_entries{0};
};

// EWMA weight: 2/(n+1) through warmup so early estimates are plain means,
// then the steady-state alpha.
inline double warmup_alpha(std::uint64_t n, std::uint64_t warmup, double alpha) noexcept {
  return n <= warmup ? 2.0 / (static_cast<double>(n) + 1.0) : alpha;
}

// Online detector over the shared severity vector. Subclasses fold one
// observation into their smoothed statistics and classify; the base owns
// the observation count, calibration gate and transition counters.
class Monitor {
 public:
  Monitor(std::string_view name, std::uint64_t warmup, const StateNames& names) noexcept
      : name_(name), warmup_(warmup), names_(names) {}
  virtual ~Monitor() = default;

  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;

  void observe_and_update(const SeverityVector& v);

  Level level() const noexcept { return level_; }
  std::string_view name() const noexcept { return name_; }
  std::string_view state_name() const noexcept { return names_[static_cast<std::size_t>(level_)]; }
  std::uint64_t observations() const noexcept { return count_; }
  std::uint64_t warmup() const noexcept { return warmup_; }
  std::uint64_t critical_entries() const noexcept { return critical_entries_; }

  // Primary test statistic compared against the thresholds.
  virtual double statistic() const noexcept = 0;
  virtual double secondary() const noexcept { return 0.0; }

  MonitorSummary summary() const;

 protected:
  // n is the 1-based observation number. Returns the level implied by the
  // updated statistics; the base forces Calibrating while n < warmup.
  virtual Level update(const SeverityVector& v, std::uint64_t n) = 0;

  double alpha_for(std::uint64_t n, double alpha) const noexcept { return warmup_alpha(n, warmup_, alpha); }

  static Level classify_high(double stat, double warn, double crit) noexcept {
    if (stat >= crit) return Level::Critical;
    if (stat >= warn) return Level::Warning;
    return Level::Nominal;
  }

 private:
  std::string_view name_;
  std::uint64_t warmup_;
  StateNames names_;
  Level level_{Level::Calibrating};
  std::uint64_t count_{0};
  std::uint64_t critical_entries_{0};
};

}} // namespace msm::monitors
