// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "msm/monitors/monitor.h"

namespace msm { namespace monitors {

// Scalar event channels folded into the severity vector. The order is the
// vector layout seen by every monitor.
enum class Signal : std::uint8_t {
  ValidateLatency = 0,
  FullProfileRate,
  ForeignRate,
  TemporalRate,
  NullRate,
  CacheMissRate,
  BloomRejectRate,
  PageOracleDisagreement,
  ArenaMissRate,
  FreeLatency,
  DoubleFree,
  ForeignFree,
  InvalidFree,
  CanaryCorruption,
  QuarantineBytePressure,
  QuarantineDepthPressure,
  AllocFailure,
  FreeContention,
  RiskUpperBound,
  StageCost,
  ProbeAnomalyRate,
  LargeAllocRate,
  InteriorPointerRate,
  FingerprintMismatch,
  EvictionRate,
};

inline constexpr std::size_t kNumSignals = 25;
static_assert(kNumSignals == kSeverityWidth, "one severity code per signal");

std::string_view to_string(Signal s) noexcept;

// Value at or above each bound raises the code by one. Informational
// channels use an unreachable warning bound and never escalate past 1.
struct SignalThresholds {
  double elevated;
  double warning;
  double critical;
};

// EWMA of each channel's event measure. Not thread-safe; the owner
// serializes access.
class BaseSignals {
 public:
  static constexpr double kAlpha = 0.05;

  void record(Signal s, double value) noexcept;
  double value(Signal s) const noexcept { return ewma_[static_cast<std::size_t>(s)]; }
  std::uint64_t samples(Signal s) const noexcept { return samples_[static_cast<std::size_t>(s)]; }
  std::uint8_t severity(Signal s) const noexcept;
  SeverityVector snapshot() const noexcept;

  static const SignalThresholds& thresholds(Signal s) noexcept;
  static std::uint8_t classify(double value, const SignalThresholds& t) noexcept;

 private:
  std::array<double, kNumSignals> ewma_{};
  std::array<std::uint64_t, kNumSignals> samples_{};
};

}} // namespace msm::monitors
